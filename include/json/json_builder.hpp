//! # JSON Builder
//!
//! This module provides a fluent API for constructing JSON values
//! programmatically. `JsonValue` is immutable, so the builder accumulates
//! members and elements in plain containers and freezes each container
//! when its context is closed.
//!
//! ## Usage Pattern
//!
//! 1. Start with `object()` or `array()`
//! 2. Add fields (for objects) or items (for arrays)
//! 3. For nested structures, call `field_object()` / `field_array()` / `item_object()` / `item_array()`
//! 4. Call `end()` to close each nested structure
//! 5. Call `build()` to get the final `JsonValue`
//!
//! Member order is preserved exactly as fields are added.
//!
//! ## Example
//!
//! ```cpp
//! auto tweet = JsonBuilder()
//!     .object()
//!         .field("id", 8500)
//!         .field_object("user")
//!             .field("id", 6200)
//!             .field("name", "Twitter API")
//!         .end()
//!         .field_object("entities")
//!             .field_array("hashtags")
//!                 .item("twitter")
//!                 .item("developer")
//!             .end()
//!         .end()
//!     .end()
//!     .build();
//! ```

#pragma once

#include "json/json_value.hpp"

#include <stack>
#include <stdexcept>
#include <string>

namespace jcodec::json {

/// Stack-based fluent builder for JSON values.
///
/// Misuse (adding a field outside an object, closing a context that was
/// never opened, building with open contexts) throws `std::logic_error`.
class JsonBuilder {
public:
    JsonBuilder() = default;

    // ========================================================================
    // Structure Methods
    // ========================================================================

    /// Opens an object context at the root.
    auto object() -> JsonBuilder&;

    /// Opens an array context at the root.
    auto array() -> JsonBuilder&;

    /// Closes the current context and attaches it to its parent.
    auto end() -> JsonBuilder&;

    // ========================================================================
    // Object Field Methods
    // ========================================================================

    auto field(const std::string& key, JsonValue value) -> JsonBuilder&;
    auto field(const std::string& key, const char* value) -> JsonBuilder&;
    auto field(const std::string& key, const std::string& value) -> JsonBuilder&;
    auto field(const std::string& key, int value) -> JsonBuilder&;
    auto field(const std::string& key, int64_t value) -> JsonBuilder&;
    auto field(const std::string& key, double value) -> JsonBuilder&;
    auto field(const std::string& key, bool value) -> JsonBuilder&;
    auto field_null(const std::string& key) -> JsonBuilder&;

    /// Opens a nested object stored under `key` when closed.
    auto field_object(const std::string& key) -> JsonBuilder&;

    /// Opens a nested array stored under `key` when closed.
    auto field_array(const std::string& key) -> JsonBuilder&;

    // ========================================================================
    // Array Item Methods
    // ========================================================================

    auto item(JsonValue value) -> JsonBuilder&;
    auto item(const char* value) -> JsonBuilder&;
    auto item(const std::string& value) -> JsonBuilder&;
    auto item(int value) -> JsonBuilder&;
    auto item(int64_t value) -> JsonBuilder&;
    auto item(double value) -> JsonBuilder&;
    auto item(bool value) -> JsonBuilder&;
    auto item_null() -> JsonBuilder&;
    auto item_object() -> JsonBuilder&;
    auto item_array() -> JsonBuilder&;

    // ========================================================================
    // Finalization
    // ========================================================================

    /// Returns the built value, or `null` if nothing was built.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if any context is still open.
    [[nodiscard]] auto build() -> JsonValue;

    [[nodiscard]] auto is_complete() const -> bool;

private:
    struct Context {
        enum class Kind { Object, Array };
        Kind kind;
        JsonObject members;
        JsonArray elements;
        std::string key; ///< Key this context is stored under in its parent object
    };

    std::stack<Context> stack_;
    JsonValue result_;
    bool has_result_ = false;

    auto open(Context::Kind kind, std::string key) -> JsonBuilder&;
    auto require(Context::Kind kind, const char* method) -> Context&;
};

} // namespace jcodec::json
