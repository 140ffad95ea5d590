//! # JSON Value Types
//!
//! This module provides the core JSON value types for jcodec. It includes
//! `JsonNumber` for precise number representation and `JsonValue` as an
//! immutable variant type for all JSON values.
//!
//! ## Features
//!
//! - **Integer precision**: Numbers without decimals are stored as `int64_t` or `uint64_t`
//! - **Type discrimination**: Query and access values by their `JsonType`
//! - **Value semantics**: `JsonValue` copies are cheap and share structure
//! - **Order-free objects**: Object equality and hashing ignore member order
//! - **Cursor traversal**: `get`, `delete_at`, folds and rewrites (see `json_cursor.hpp`)
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | `bool` | Standard boolean comparison |
//! | `number` | Numeric comparison (see `JsonNumber::operator==`) |
//! | `string` | Byte-by-byte string comparison |
//! | `array` | Element-by-element in order |
//! | `object` | Same multiset of (key, value) members, any order |
//!
//! Values of different types are never equal, even `null` and `{}`.
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json_value.hpp"
//! using namespace jcodec::json;
//!
//! auto tweet = json_object({
//!     {"id", json_int(8500)},
//!     {"user", json_object({{"id", json_int(6200)}, {"name", json_string("Twitter API")}})},
//! });
//!
//! if (auto* user = tweet.find("user"); user && user->is_object()) {
//!     std::cout << user->find("name")->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jcodec::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;
class JsonCursor;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// One member of a JSON object.
using JsonMember = std::pair<std::string, JsonValue>;

/// A JSON object: members in insertion order. Keys need not be unique.
using JsonObject = std::vector<JsonMember>;

/// A partial rewrite rule for `JsonValue::transform_down_with_cursor`.
///
/// Returns the replacement for a node, or `std::nullopt` when the rule does
/// not apply at that node.
using CursorRule = std::function<std::optional<JsonValue>(const JsonValue&, const JsonCursor&)>;

/// The runtime type of a JSON value.
enum class JsonType : uint8_t { Null, Bool, Num, Str, Arr, Obj };

/// Returns the display name of a JSON type ("Null", "Bool", "Num", ...).
[[nodiscard]] auto type_name(JsonType type) -> const char*;

// ============================================================================
// JsonNumber
// ============================================================================

/// Discriminated union for JSON numbers preserving integer precision.
///
/// JSON numbers are stored in their most precise representation:
/// - Integers without decimals/exponents are stored as `Int64` or `Uint64`
/// - Numbers with decimals or exponents are stored as `Double`
///
/// # Example
///
/// ```cpp
/// JsonNumber i(int64_t{42});  // Int64
/// JsonNumber u(UINT64_MAX);   // Uint64
/// JsonNumber f(3.14);         // Double
///
/// if (auto val = i.try_as_i32()) {
///     int32_t x = *val;  // Safe, no overflow
/// }
/// ```
struct JsonNumber {
    /// The storage kind for this number.
    enum class Kind : uint8_t {
        Int64,  ///< Signed 64-bit integer (`i64` field)
        Uint64, ///< Unsigned 64-bit integer (`u64` field)
        Double  ///< IEEE 754 double precision float (`f64` field)
    };

    /// The storage kind for this number.
    Kind kind;

    /// The number value (only one field is active based on `kind`).
    union {
        int64_t i64;  ///< Active when `kind == Kind::Int64`
        uint64_t u64; ///< Active when `kind == Kind::Uint64`
        double f64;   ///< Active when `kind == Kind::Double`
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}

    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}

    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    /// Default constructor creates zero as `Int64`.
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    /// Returns `true` if this is an integer (`Int64` or `Uint64`).
    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    /// Returns `true` if this is a floating-point number (`Double`).
    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Double;
    }

    /// Attempts to get the value as `int64_t`.
    ///
    /// Returns `std::nullopt` if:
    /// - The value is a `Double` with a fractional part or out of range
    /// - The value is a `Uint64` larger than `INT64_MAX`
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t>;

    /// Attempts to get the value as `uint64_t`.
    ///
    /// Returns `std::nullopt` if the value is negative, fractional or out of range.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t>;

    /// Gets the value as `double`.
    ///
    /// This conversion always succeeds but may lose precision for large integers
    /// (values larger than 2^53 may not round-trip correctly).
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Compares two `JsonNumber` values for equality.
    ///
    /// Numbers of different kinds are compared as doubles.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const JsonNumber& other) const -> bool {
        return !(*this == other);
    }

    /// Hash consistent with `operator==` across storage kinds.
    [[nodiscard]] auto hash() const -> size_t;
};

// ============================================================================
// JsonValue
// ============================================================================

/// Immutable JSON value.
///
/// `JsonValue` can hold any of the six JSON types: null, boolean, number,
/// string, array, or object. Arrays and objects are held through
/// reference-counted pointers to const containers, so copying a value is
/// cheap and every operation that "changes" a tree returns a new tree that
/// shares the untouched branches with the original.
///
/// # Type Hierarchy
///
/// | JSON Type | C++ Storage | Query Method | Accessor |
/// |-----------|-------------|--------------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `JsonNumber` | `is_number()` | `as_number()`, `as_i64()`, `as_f64()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Rc<const JsonArray>` | `is_array()` | `as_array()`, `operator[]` |
/// | object | `Rc<const JsonObject>` | `is_object()` | `as_object()`, `find()` |
struct JsonValue {
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible JSON values.
    using ValueVariant = std::variant<Null,                    // null
                                      bool,                    // boolean
                                      JsonNumber,              // number
                                      std::string,             // string
                                      Rc<const JsonArray>,     // array (shared)
                                      Rc<const JsonObject>>;   // object (shared)

    /// The underlying variant storage.
    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}

    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(uint64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(double value) : data(JsonNumber(value)) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value) : data(make_rc<const JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_rc<const JsonObject>(std::move(value))) {}

    explicit JsonValue(JsonNumber value) : data(value) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    /// Returns the runtime type of this value.
    [[nodiscard]] auto type() const -> JsonType {
        return static_cast<JsonType>(data.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Rc<const JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Rc<const JsonObject>>(data);
    }

    /// Returns `true` if this value is an integer number.
    [[nodiscard]] auto is_integer() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_integer();
        }
        return false;
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================

    /// Gets the boolean value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    /// Gets the number value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a number.
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    /// Gets the string value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a string.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    /// Gets the array value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Rc<const JsonArray>>(data);
    }

    /// Gets the object value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Rc<const JsonObject>>(data);
    }

    /// Gets the number as `int64_t`.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if this is not an integer or would overflow.
    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::runtime_error("JSON number cannot be converted to int64_t");
        }
        return *opt;
    }

    /// Gets the number as `double`.
    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    // ========================================================================
    // Member Access
    // ========================================================================

    /// Finds the first object member with the given key.
    ///
    /// Returns `nullptr` if this is not an object or the key does not exist.
    [[nodiscard]] auto find(std::string_view key) const -> const JsonValue*;

    /// Gets an array element by index.
    ///
    /// # Panics
    ///
    /// Throws if this is not an array or index is out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Gets the size of an array or object. Returns `0` for other types.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Rc<const JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Rc<const JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // ========================================================================
    // Cursor Navigation
    // ========================================================================

    /// Resolves a cursor against this tree.
    ///
    /// Each step either succeeds or short-circuits with a `CursorError`:
    /// - `Field(name)` on an object without `name` fails with `NoSuchField`
    /// - `Element(i)` past the end of an array fails with `IndexOutOfBounds`
    /// - a `Filter(T)` step, or a structural step on the wrong container,
    ///   fails with `TypeMismatch`
    ///
    /// # Example
    ///
    /// ```cpp
    /// auto tag = tweet.get(cursor::field("entities").is_object().field("hashtags")
    ///                          .is_array().element(1));
    /// // Ok(Str("developer"))
    /// ```
    [[nodiscard]] auto get(const JsonCursor& cursor) const -> Result<JsonValue, CursorError>;

    /// Returns a new tree with the node at `cursor` removed.
    ///
    /// - Removing a field drops every member with that key from the parent object
    /// - Removing an element shifts the later elements down
    /// - Removing the identity cursor yields `null`
    /// - A type mismatch anywhere on the path (including a trailing `Filter`)
    ///   leaves the tree unchanged
    ///
    /// `NoSuchField` and `IndexOutOfBounds` are reported as errors.
    [[nodiscard]] auto delete_at(const JsonCursor& cursor) const -> Result<JsonValue, CursorError>;

    // ========================================================================
    // Folds
    // ========================================================================

    /// Folds the tree bottom-up.
    ///
    /// `f(acc, node)` is applied to every node after all of its children,
    /// children left to right, so leaves come before the containers holding
    /// them and the root comes last.
    template <typename A, typename F> [[nodiscard]] auto fold_up(A seed, F&& f) const -> A {
        if (auto* arr = std::get_if<Rc<const JsonArray>>(&data)) {
            for (const auto& elem : **arr) {
                seed = elem.fold_up(std::move(seed), f);
            }
        } else if (auto* obj = std::get_if<Rc<const JsonObject>>(&data)) {
            for (const auto& member : **obj) {
                seed = member.second.fold_up(std::move(seed), f);
            }
        }
        return f(std::move(seed), *this);
    }

    /// Folds the tree top-down.
    ///
    /// `f(acc, node)` is applied to a node before its children, root first,
    /// then each child left to right, recursively.
    template <typename A, typename F> [[nodiscard]] auto fold_down(A seed, F&& f) const -> A {
        seed = f(std::move(seed), *this);
        if (auto* arr = std::get_if<Rc<const JsonArray>>(&data)) {
            for (const auto& elem : **arr) {
                seed = elem.fold_down(std::move(seed), f);
            }
        } else if (auto* obj = std::get_if<Rc<const JsonObject>>(&data)) {
            for (const auto& member : **obj) {
                seed = member.second.fold_down(std::move(seed), f);
            }
        }
        return seed;
    }

    // ========================================================================
    // Rewrites
    // ========================================================================

    /// Rewrites the tree top-down with a partial rule that also sees the
    /// cursor of each node.
    ///
    /// The rule is tested at the root first. When it matches, the node is
    /// replaced and the descent continues into the replacement's children;
    /// otherwise it continues into the original children. Children of an
    /// object are reached through `cursor.is_object().field(key)` and
    /// children of an array through `cursor.is_array().element(i)`.
    [[nodiscard]] auto transform_down_with_cursor(const CursorRule& rule) const -> JsonValue;

    /// Rewrites every node top-down: `f` sees a node before its children.
    [[nodiscard]] auto
    transform_down(const std::function<JsonValue(const JsonValue&)>& f) const -> JsonValue;

    /// Rewrites every node bottom-up: `f` sees a node after its children
    /// have been rewritten.
    [[nodiscard]] auto
    transform_up(const std::function<JsonValue(const JsonValue&)>& f) const -> JsonValue;

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Serializes this value to a compact JSON string.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Serializes this value to a pretty-printed JSON string.
    ///
    /// Object members go on their own lines indented by two spaces per
    /// level, with `" : "` between key and value. Arrays stay on one line
    /// with `", "` between elements.
    [[nodiscard]] auto to_string_pretty() const -> std::string;

    /// Writes this value to an output stream in compact format.
    auto write_to(std::ostream& os) const -> std::ostream&;

    /// Writes this value to an output stream in pretty-printed format.
    auto write_to_pretty(std::ostream& os) const -> std::ostream&;

    // ========================================================================
    // Comparison
    // ========================================================================

    /// Compares two `JsonValue` values for equality.
    ///
    /// Values of different types are never equal. Arrays are compared
    /// element-by-element, objects as multisets of members.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }

    /// Hash consistent with `operator==`.
    ///
    /// Object member hashes are combined commutatively so that member order
    /// does not matter; array element hashes are combined positionally.
    [[nodiscard]] auto hash() const -> size_t;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

/// Creates an integer JSON value.
///
/// # Example
///
/// ```cpp
/// auto val = json_int(42);
/// assert(val.is_integer());
/// ```
inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_uint(uint64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_float(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

/// Creates an array JSON value.
///
/// # Example
///
/// ```cpp
/// auto arr = json_array({json_string("twitter"), json_string("developer")});
/// ```
inline auto json_array(JsonArray elements = {}) -> JsonValue {
    return JsonValue(std::move(elements));
}

/// Creates an object JSON value. Member order is preserved.
///
/// # Example
///
/// ```cpp
/// auto obj = json_object({{"name", json_string("Alice")}, {"age", json_int(30)}});
/// ```
inline auto json_object(JsonObject members = {}) -> JsonValue {
    return JsonValue(std::move(members));
}

} // namespace jcodec::json

template <> struct std::hash<jcodec::json::JsonValue> {
    auto operator()(const jcodec::json::JsonValue& value) const noexcept -> size_t {
        return value.hash();
    }
};
