//! # JSON Lexer Implementation
//!
//! String and number scanning follow RFC 8259. Strings accept every escape
//! of the standard, including surrogate pairs in `\u` escapes, and reject
//! raw control characters.

#include "json/json_lexer.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace jcodec::json {

FieldMatcher::FieldMatcher(std::vector<std::string> names) : names_(std::move(names)) {
    for (size_t i = 0; i < names_.size(); ++i) {
        index_.emplace(names_[i], static_cast<int>(i));
    }
}

auto FieldMatcher::match(std::string_view name) const -> int {
    auto it = index_.find(std::string(name));
    return it == index_.end() ? -1 : it->second;
}

namespace lexer {

namespace {

auto describe(int c) -> std::string {
    if (c < 0) {
        return "end of input";
    }
    return std::string("'") + static_cast<char>(c) + "'";
}

auto unexpected(int c, const DecodeTrace& trace) -> DecodeError {
    if (c < 0) {
        return DecodeError::make("unexpected end of input", trace);
    }
    return DecodeError::make("unexpected " + describe(c), trace);
}

auto is_digit(int c) -> bool {
    return c >= '0' && c <= '9';
}

auto hex_value(int c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// Reads four hex digits of a `\u` escape. Returns `-1` on malformed input.
auto read_hex4(JsonReader& in) -> long {
    long value = 0;
    for (int i = 0; i < 4; ++i) {
        int digit = hex_value(in.read());
        if (digit < 0) {
            return -1;
        }
        value = (value << 4) | digit;
    }
    return value;
}

void append_utf8(std::string& out, unsigned long codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

/// Consumes the rest of a keyword whose first character has been read.
auto keyword_tail(const DecodeTrace& trace, JsonReader& in, std::string_view tail,
                  std::string_view keyword) -> Result<Unit, DecodeError> {
    for (char expected : tail) {
        if (in.read() != static_cast<unsigned char>(expected)) {
            return DecodeError::make("expected '" + std::string(keyword) + "'", trace);
        }
    }
    return Unit{};
}

/// Checks `text` against the RFC 8259 number grammar and converts it.
auto parse_number_text(std::string_view text) -> Result<JsonNumber, std::string> {
    size_t pos = 0;
    auto peek = [&]() -> char { return pos < text.size() ? text[pos] : '\0'; };

    if (peek() == '-') {
        ++pos;
    }
    if (peek() == '0') {
        ++pos;
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            ++pos;
        }
    } else {
        return std::string("expected a number");
    }

    bool is_float = false;
    if (peek() == '.') {
        is_float = true;
        ++pos;
        if (!is_digit(peek())) {
            return std::string("expected a number");
        }
        while (is_digit(peek())) {
            ++pos;
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        ++pos;
        if (peek() == '+' || peek() == '-') {
            ++pos;
        }
        if (!is_digit(peek())) {
            return std::string("expected a number");
        }
        while (is_digit(peek())) {
            ++pos;
        }
    }
    if (pos != text.size()) {
        return std::string("expected a number");
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (!is_float) {
        if (text[0] == '-') {
            int64_t value = 0;
            if (auto [ptr, ec] = std::from_chars(first, last, value); ec == std::errc{}) {
                return JsonNumber(value);
            }
        } else {
            uint64_t value = 0;
            if (auto [ptr, ec] = std::from_chars(first, last, value); ec == std::errc{}) {
                if (value <= static_cast<uint64_t>(INT64_MAX)) {
                    return JsonNumber(static_cast<int64_t>(value));
                }
                return JsonNumber(value);
            }
        }
        // Overflow - fall back to double
    }
    double value = std::strtod(std::string(text).c_str(), nullptr);
    if (!std::isfinite(value)) {
        return std::string("number out of range");
    }
    return JsonNumber(value);
}

auto skip_value_at(const DecodeTrace& trace, JsonReader& in, size_t depth)
    -> Result<Unit, DecodeError> {
    int c = in.next_non_whitespace();
    switch (c) {
    case '"': {
        in.retract();
        auto s = string(trace, in);
        if (is_err(s)) {
            return unwrap_err(s);
        }
        return Unit{};
    }
    case 't':
    case 'f': {
        in.retract();
        auto b = boolean(trace, in);
        if (is_err(b)) {
            return unwrap_err(b);
        }
        return Unit{};
    }
    case 'n':
        in.retract();
        return null_literal(trace, in);
    case '{': {
        if (depth >= CodecOptions::max_depth) {
            return DecodeError::make("maximum nesting depth exceeded", trace);
        }
        auto more = first_object(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return Unit{};
            }
            auto key = field_name(trace, in);
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto skipped = skip_value_at(trace, in, depth + 1);
            if (is_err(skipped)) {
                return skipped;
            }
            more = next_object(trace, in);
        }
    }
    case '[': {
        if (depth >= CodecOptions::max_depth) {
            return DecodeError::make("maximum nesting depth exceeded", trace);
        }
        auto more = first_array(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return Unit{};
            }
            auto skipped = skip_value_at(trace, in, depth + 1);
            if (is_err(skipped)) {
                return skipped;
            }
            more = next_array(trace, in);
        }
    }
    default:
        if (c == '-' || is_digit(c)) {
            in.retract();
            auto n = number(trace, in);
            if (is_err(n)) {
                return unwrap_err(n);
            }
            return Unit{};
        }
        return unexpected(c, trace);
    }
}

} // namespace

auto peek(JsonReader& in) -> int {
    int c = in.next_non_whitespace();
    in.retract();
    return c;
}

auto expect_char(const DecodeTrace& trace, JsonReader& in, char expected)
    -> Result<Unit, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == static_cast<unsigned char>(expected)) {
        return Unit{};
    }
    if (c < 0) {
        return DecodeError::make("unexpected end of input", trace);
    }
    return DecodeError::make(std::string("expected '") + expected + "' got " + describe(c),
                             trace);
}

auto first_object(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == '}') {
        return false;
    }
    if (c < 0) {
        return DecodeError::make("unexpected end of input", trace);
    }
    in.retract();
    return true;
}

auto next_object(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == ',') {
        return true;
    }
    if (c == '}') {
        return false;
    }
    return DecodeError::make("expected ',' or '}' got " + describe(c), trace);
}

auto first_array(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == ']') {
        return false;
    }
    if (c < 0) {
        return DecodeError::make("unexpected end of input", trace);
    }
    in.retract();
    return true;
}

auto next_array(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == ',') {
        return true;
    }
    if (c == ']') {
        return false;
    }
    return DecodeError::make("expected ',' or ']' got " + describe(c), trace);
}

auto string(const DecodeTrace& trace, JsonReader& in) -> Result<std::string, DecodeError> {
    auto open = expect_char(trace, in, '"');
    if (is_err(open)) {
        return unwrap_err(open);
    }

    std::string value;
    while (true) {
        int c = in.read();
        if (c < 0) {
            return DecodeError::make("unterminated string", trace);
        }
        if (c == '"') {
            return value;
        }
        if (c < 0x20) {
            return DecodeError::make("invalid control in string", trace);
        }
        if (c != '\\') {
            value += static_cast<char>(c);
            continue;
        }

        int escaped = in.read();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            long codepoint = read_hex4(in);
            if (codepoint < 0) {
                return DecodeError::make("invalid unicode escape", trace);
            }
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                // High surrogate: a low surrogate escape must follow
                if (in.read() != '\\' || in.read() != 'u') {
                    return DecodeError::make("invalid unicode escape", trace);
                }
                long low = read_hex4(in);
                if (low < 0xDC00 || low > 0xDFFF) {
                    return DecodeError::make("invalid unicode escape", trace);
                }
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
            } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                return DecodeError::make("invalid unicode escape", trace);
            }
            append_utf8(value, static_cast<unsigned long>(codepoint));
            break;
        }
        default:
            return DecodeError::make("invalid escape " + describe(escaped), trace);
        }
    }
}

auto field_name(const DecodeTrace& trace, JsonReader& in) -> Result<std::string, DecodeError> {
    auto key = string(trace, in);
    if (is_err(key)) {
        return key;
    }
    auto colon = expect_char(trace, in, ':');
    if (is_err(colon)) {
        return unwrap_err(colon);
    }
    return key;
}

auto field(const DecodeTrace& trace, JsonReader& in, const FieldMatcher& matcher)
    -> Result<int, DecodeError> {
    auto key = field_name(trace, in);
    if (is_err(key)) {
        return unwrap_err(key);
    }
    return matcher.match(unwrap(key));
}

auto enumeration(const DecodeTrace& trace, JsonReader& in, const FieldMatcher& matcher)
    -> Result<int, DecodeError> {
    auto value = string(trace, in);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return matcher.match(unwrap(value));
}

auto boolean(const DecodeTrace& trace, JsonReader& in) -> Result<bool, DecodeError> {
    int c = in.next_non_whitespace();
    if (c == 't') {
        auto tail = keyword_tail(trace, in, "rue", "true");
        if (is_err(tail)) {
            return unwrap_err(tail);
        }
        return true;
    }
    if (c == 'f') {
        auto tail = keyword_tail(trace, in, "alse", "false");
        if (is_err(tail)) {
            return unwrap_err(tail);
        }
        return false;
    }
    return DecodeError::make("expected a boolean", trace);
}

auto null_literal(const DecodeTrace& trace, JsonReader& in) -> Result<Unit, DecodeError> {
    int c = in.next_non_whitespace();
    if (c != 'n') {
        return DecodeError::make("expected 'null'", trace);
    }
    return keyword_tail(trace, in, "ull", "null");
}

auto number(const DecodeTrace& trace, JsonReader& in) -> Result<JsonNumber, DecodeError> {
    std::string text;
    int c = in.next_non_whitespace();
    while (is_digit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E') {
        text += static_cast<char>(c);
        c = in.read();
    }
    in.retract();

    auto parsed = parse_number_text(text);
    if (is_err(parsed)) {
        return DecodeError::make(unwrap_err(parsed), trace);
    }
    return unwrap(parsed);
}

auto skip_value(const DecodeTrace& trace, JsonReader& in) -> Result<Unit, DecodeError> {
    return skip_value_at(trace, in, 0);
}

auto expect_end(const DecodeTrace& trace, JsonReader& in) -> Result<Unit, DecodeError> {
    int c = in.next_non_whitespace();
    if (c >= 0) {
        return DecodeError::make("unexpected trailing content", trace);
    }
    return Unit{};
}

} // namespace lexer

} // namespace jcodec::json
