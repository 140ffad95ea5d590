//! # JSON Lexer
//!
//! Pull-style lexing primitives used by every decoder. Each function reads
//! exactly the characters of one token (skipping leading whitespace) from a
//! `JsonReader` and reports failures as a `DecodeError` carrying the
//! caller's trace.
//!
//! ## Object and Array Loops
//!
//! ```cpp
//! auto open = lexer::expect_char(trace, in, '{');
//! if (is_err(open)) return unwrap_err(open);
//!
//! auto more = lexer::first_object(trace, in);
//! while (true) {
//!     if (is_err(more)) return unwrap_err(more);
//!     if (!unwrap(more)) break;
//!     // ... lexer::field(...), then the member's decoder ...
//!     more = lexer::next_object(trace, in);
//! }
//! ```
//!
//! ## Number Grammar
//!
//! Numbers follow RFC 8259: optional `-`, an integer part without leading
//! zeros, an optional fraction and an optional exponent. Integers are kept
//! as `Int64` (or `Uint64` above `INT64_MAX`); integers out of both ranges,
//! fractions and exponents become `Double`.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_reader.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jcodec::json {

/// Recognizes which of a fixed set of names a token equals.
///
/// Used for object field names and for sum type tags.
class FieldMatcher {
public:
    FieldMatcher() = default;

    explicit FieldMatcher(std::vector<std::string> names);

    /// Returns the index of `name`, or `-1` if it is not one of the names.
    [[nodiscard]] auto match(std::string_view name) const -> int;

    [[nodiscard]] auto name(size_t index) const -> const std::string& {
        return names_[index];
    }

    [[nodiscard]] auto size() const -> size_t {
        return names_.size();
    }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, int> index_;
};

namespace lexer {

/// Returns the next non-whitespace byte without consuming it.
[[nodiscard]] auto peek(JsonReader& in) -> int;

/// Consumes `expected` after optional whitespace.
///
/// Fails with `"expected 'x' got 'y'"` or `"unexpected end of input"`.
[[nodiscard]] auto expect_char(const DecodeTrace& trace, JsonReader& in, char expected)
    -> Result<Unit, DecodeError>;

/// Called after `{`. Returns `false` if the object is empty (and consumes `}`).
[[nodiscard]] auto first_object(const DecodeTrace& trace, JsonReader& in)
    -> Result<bool, DecodeError>;

/// Called after a member. Returns `true` after `,` and `false` after `}`.
[[nodiscard]] auto next_object(const DecodeTrace& trace, JsonReader& in)
    -> Result<bool, DecodeError>;

/// Called after `[`. Returns `false` if the array is empty (and consumes `]`).
[[nodiscard]] auto first_array(const DecodeTrace& trace, JsonReader& in)
    -> Result<bool, DecodeError>;

/// Called after an element. Returns `true` after `,` and `false` after `]`.
[[nodiscard]] auto next_array(const DecodeTrace& trace, JsonReader& in)
    -> Result<bool, DecodeError>;

/// Reads a string literal and unescapes it.
[[nodiscard]] auto string(const DecodeTrace& trace, JsonReader& in)
    -> Result<std::string, DecodeError>;

/// Reads an object key and the `:` after it.
[[nodiscard]] auto field_name(const DecodeTrace& trace, JsonReader& in)
    -> Result<std::string, DecodeError>;

/// Reads an object key and the `:` after it, and matches the key.
///
/// # Returns
///
/// The index of the key in `matcher`, or `-1` for an unknown key.
[[nodiscard]] auto field(const DecodeTrace& trace, JsonReader& in, const FieldMatcher& matcher)
    -> Result<int, DecodeError>;

/// Reads a string literal and matches it against `matcher`.
///
/// # Returns
///
/// The index of the string in `matcher`, or `-1` for an unknown string.
[[nodiscard]] auto enumeration(const DecodeTrace& trace, JsonReader& in,
                               const FieldMatcher& matcher) -> Result<int, DecodeError>;

/// Reads `true` or `false`.
[[nodiscard]] auto boolean(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError>;

/// Reads `null`.
[[nodiscard]] auto null_literal(const DecodeTrace& trace, JsonReader& in)
    -> Result<Unit, DecodeError>;

/// Reads a number literal.
[[nodiscard]] auto number(const DecodeTrace& trace, JsonReader& in)
    -> Result<JsonNumber, DecodeError>;

/// Reads and discards one complete value of any type.
///
/// Fails if the value nests deeper than `CodecOptions::max_depth`.
[[nodiscard]] auto skip_value(const DecodeTrace& trace, JsonReader& in)
    -> Result<Unit, DecodeError>;

/// Reads the remaining input and fails unless it is only whitespace.
[[nodiscard]] auto expect_end(const DecodeTrace& trace, JsonReader& in)
    -> Result<Unit, DecodeError>;

} // namespace lexer

} // namespace jcodec::json
