//! # JSON Output Sinks
//!
//! Encoders stream their output into a `JsonWriter` instead of building
//! intermediate strings. This module provides the writer interface, the
//! concrete sinks and the low-level formatting helpers shared by every
//! encoder.
//!
//! ## Writers
//!
//! | Writer | Destination |
//! |--------|-------------|
//! | `StringWriter` | An owned `std::string` |
//! | `StreamWriter` | A borrowed `std::ostream` |
//! | `NestedObjectWriter` | Another writer, merging an object into one already open |
//!
//! ## Indentation
//!
//! `Indent` is `std::nullopt` for compact output. In pretty mode it holds
//! the current nesting level and `pad` writes a newline followed by two
//! spaces per level.

#pragma once

#include "json/json_value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace jcodec::json {

/// Indentation state: `std::nullopt` for compact output, the nesting level
/// for pretty output.
using Indent = std::optional<int>;

/// Character sink for encoders.
class JsonWriter {
public:
    virtual ~JsonWriter() = default;

    virtual void write(char c) = 0;
    virtual void write(std::string_view text) = 0;
};

/// Accumulates output in a string.
class StringWriter : public JsonWriter {
public:
    void write(char c) override {
        buffer_.push_back(c);
    }

    void write(std::string_view text) override {
        buffer_.append(text);
    }

    [[nodiscard]] auto str() const -> const std::string& {
        return buffer_;
    }

    [[nodiscard]] auto take() -> std::string {
        return std::move(buffer_);
    }

private:
    std::string buffer_;
};

/// Forwards output to an `std::ostream` owned by the caller.
class StreamWriter : public JsonWriter {
public:
    explicit StreamWriter(std::ostream& os) : os_(os) {}

    void write(char c) override {
        os_.put(c);
    }

    void write(std::string_view text) override {
        os_.write(text.data(), static_cast<std::streamsize>(text.size()));
    }

private:
    std::ostream& os_;
};

/// Merges an encoded object into an object the caller has already opened.
///
/// Used by discriminated sum encoders: the caller writes `{"type":"Tag"`
/// and then lets the variant encoder write its own object through this
/// writer. The writer:
///
/// 1. drops spaces and newlines until the variant's first member starts
/// 2. swallows the variant's opening `{`
/// 3. on the next significant character writes `,` and a pad at `indent`,
///    unless that character is `}` (the variant had no members)
/// 4. forwards everything else verbatim, including the closing `}`
class NestedObjectWriter : public JsonWriter {
public:
    NestedObjectWriter(JsonWriter& out, Indent indent) : out_(out), indent_(indent) {}

    void write(char c) override {
        write(std::string_view(&c, 1));
    }

    void write(std::string_view text) override;

private:
    JsonWriter& out_;
    Indent indent_;
    bool first_ = true;
    bool second_ = true;
};

// ============================================================================
// Formatting Helpers
// ============================================================================

/// Writes a newline and `2 * level` spaces in pretty mode; nothing in compact mode.
void pad(const Indent& indent, JsonWriter& out);

/// Returns the indentation one level deeper (compact stays compact).
[[nodiscard]] inline auto bump(const Indent& indent) -> Indent {
    if (indent) {
        return *indent + 1;
    }
    return std::nullopt;
}

/// Writes `text` as a quoted JSON string literal.
///
/// `"` and `\` are escaped, as are the control characters below 0x20:
/// `\b`, `\f`, `\n`, `\r`, `\t` by name and the rest as `\u00XX`.
/// All other bytes are written through unchanged.
void write_escaped(std::string_view text, JsonWriter& out);

/// Formats a finite double using the shortest representation that
/// round-trips, with `.0` appended when the result would look like an
/// integer.
[[nodiscard]] auto format_double(double value) -> std::string;

/// Writes a JSON number. Integers are written exactly. Non-finite doubles
/// are written as the strings `"NaN"`, `"Infinity"` and `"-Infinity"`.
void write_number(const JsonNumber& number, JsonWriter& out);

} // namespace jcodec::json
