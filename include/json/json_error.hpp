//! # JSON Error Types
//!
//! This module provides the error types reported by the JSON library.
//!
//! ## Error Families
//!
//! | Type | Raised by | Carries |
//! |------|-----------|---------|
//! | `CursorError` | `JsonValue::get`, `JsonValue::delete_at` | Closed kind + message |
//! | `DecodeError` | Every `Decoder<T>` | Message + trace of location steps |
//! | `JsonError` | `parse_cursor` | Message + line/column/offset |
//!
//! None of these are thrown. They travel inside `Result<T, E>`.
//!
//! ## Example
//!
//! ```cpp
//! auto result = from_json<Tweet>(text);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//!     // Output: ".user.name(missing)"
//! }
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jcodec::json {

enum class JsonType : uint8_t;

/// An error encountered while parsing textual input that has a location.
///
/// `JsonError` contains a human-readable message and optional source location
/// information.
///
/// # Fields
///
/// - `message`: Description of what went wrong
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input (0 if unknown)
struct JsonError {
    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred (0 if unknown).
    size_t offset = 0;

    /// Creates an error with message only.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error with full location information.
    ///
    /// # Arguments
    ///
    /// * `msg` - The error message
    /// * `line` - 1-based line number
    /// * `column` - 1-based column number
    /// * `offset` - Byte offset (optional, defaults to 0)
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as a human-readable string.
    ///
    /// The format depends on available location information:
    /// - With line and column: `"line X, column Y: message"`
    /// - With line only: `"line X: message"`
    /// - Without location: `"message"`
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

// ============================================================================
// Navigation Errors
// ============================================================================

/// A failed cursor navigation.
///
/// The set of kinds is closed. Callers branch on `kind` to decide how to
/// recover; `JsonValue::delete_at` for example treats `TypeMismatch` as a
/// guard and returns the tree unchanged.
struct CursorError {
    enum class Kind : uint8_t {
        NoSuchField,      ///< A `Field` step named a key the object does not have
        IndexOutOfBounds, ///< An `Element` step went past the end of the array
        TypeMismatch      ///< A step met a value of the wrong JSON type
    };

    Kind kind;
    std::string message;

    static auto no_such_field(std::string_view name) -> CursorError;
    static auto index_out_of_bounds(size_t index, size_t size) -> CursorError;
    static auto type_mismatch(JsonType expected, JsonType actual) -> CursorError;

    [[nodiscard]] auto to_string() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto operator==(const CursorError& other) const -> bool = default;
};

// ============================================================================
// Decode Errors
// ============================================================================

/// One location step on the way from the document root to a decode failure.
struct TraceStep {
    enum class Kind : uint8_t {
        Field,  ///< Object member, rendered `.name`
        Index,  ///< Array element, rendered `[i]`
        Variant ///< Sum type alternative, rendered `{Tag}`
    };

    Kind kind;
    std::string name;
    size_t index = 0;

    static auto field(std::string name) -> TraceStep {
        return TraceStep{Kind::Field, std::move(name), 0};
    }
    static auto element(size_t index) -> TraceStep {
        return TraceStep{Kind::Index, {}, index};
    }
    static auto variant(std::string tag) -> TraceStep {
        return TraceStep{Kind::Variant, std::move(tag), 0};
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const TraceStep& other) const -> bool = default;
};

/// The location of the value currently being decoded.
///
/// Decoders receive the trace of their own position and extend it when they
/// descend. Steps are stored root first; `DecodeError` reverses them.
class DecodeTrace {
public:
    DecodeTrace() = default;

    [[nodiscard]] auto with_field(std::string_view name) const -> DecodeTrace {
        return with(TraceStep::field(std::string(name)));
    }
    [[nodiscard]] auto with_index(size_t index) const -> DecodeTrace {
        return with(TraceStep::element(index));
    }
    [[nodiscard]] auto with_variant(std::string_view tag) const -> DecodeTrace {
        return with(TraceStep::variant(std::string(tag)));
    }

    [[nodiscard]] auto steps() const -> const std::vector<TraceStep>& {
        return steps_;
    }

private:
    std::vector<TraceStep> steps_;

    [[nodiscard]] auto with(TraceStep step) const -> DecodeTrace {
        DecodeTrace next = *this;
        next.steps_.push_back(std::move(step));
        return next;
    }
};

/// A structured decode failure.
///
/// # Fields
///
/// - `message`: The terminal message (`"missing"`, `"duplicate"`, ...)
/// - `trace`: Location steps, innermost first
///
/// # Example
///
/// ```cpp
/// auto error = DecodeError::make("missing", DecodeTrace().with_field("user").with_field("name"));
/// error.to_string(); // ".user.name(missing)"
/// ```
struct DecodeError {
    std::string message;
    std::vector<TraceStep> trace;

    static auto make(std::string message, const DecodeTrace& at) -> DecodeError;

    /// Renders the path root first followed by the message in parentheses.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const DecodeError& other) const -> bool = default;
};

} // namespace jcodec::json
