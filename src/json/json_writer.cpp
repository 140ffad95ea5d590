//! # JSON Output Sinks
//!
//! Implements the shared formatting helpers and the nested-object merge.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Control (0x00-0x1F) | `\uXXXX` |

#include "json/json_writer.hpp"

#include <charconv>
#include <cmath>

namespace jcodec::json {

void pad(const Indent& indent, JsonWriter& out) {
    if (!indent) {
        return;
    }
    out.write('\n');
    for (int i = 0; i < *indent; ++i) {
        out.write("  ");
    }
}

void write_escaped(std::string_view text, JsonWriter& out) {
    static constexpr char HEX[] = "0123456789abcdef";

    out.write('"');
    size_t run_start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        const char* named = nullptr;
        switch (c) {
        case '"':
            named = "\\\"";
            break;
        case '\\':
            named = "\\\\";
            break;
        case '\b':
            named = "\\b";
            break;
        case '\f':
            named = "\\f";
            break;
        case '\n':
            named = "\\n";
            break;
        case '\r':
            named = "\\r";
            break;
        case '\t':
            named = "\\t";
            break;
        default:
            if (c >= 0x20) {
                continue;
            }
            break;
        }

        // Flush the unescaped run before this character
        out.write(text.substr(run_start, i - run_start));
        run_start = i + 1;

        if (named) {
            out.write(named);
        } else {
            char buf[6] = {'\\', 'u', '0', '0', HEX[c >> 4], HEX[c & 0xF]};
            out.write(std::string_view(buf, sizeof(buf)));
        }
    }
    out.write(text.substr(run_start));
    out.write('"');
}

auto format_double(double value) -> std::string {
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string result(buf, ec == std::errc() ? end : buf);

    // Ensure there's a decimal point for floats
    if (result.find('.') == std::string::npos && result.find('e') == std::string::npos &&
        result.find("inf") == std::string::npos && result.find("nan") == std::string::npos) {
        result += ".0";
    }
    return result;
}

void write_number(const JsonNumber& number, JsonWriter& out) {
    switch (number.kind) {
    case JsonNumber::Kind::Int64:
        out.write(std::to_string(number.i64));
        return;
    case JsonNumber::Kind::Uint64:
        out.write(std::to_string(number.u64));
        return;
    case JsonNumber::Kind::Double:
        if (std::isnan(number.f64)) {
            out.write("\"NaN\"");
        } else if (std::isinf(number.f64)) {
            out.write(number.f64 > 0 ? "\"Infinity\"" : "\"-Infinity\"");
        } else {
            out.write(format_double(number.f64));
        }
        return;
    }
}

// ============================================================================
// NestedObjectWriter
// ============================================================================

void NestedObjectWriter::write(std::string_view text) {
    if (!first_ && !second_) {
        out_.write(text);
        return;
    }

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == ' ' || c == '\n') {
            continue;
        }
        if (first_ && c == '{') {
            first_ = false;
            continue;
        }
        if (second_) {
            second_ = false;
            if (c != '}') {
                out_.write(',');
                pad(indent_, out_);
            }
            out_.write(text.substr(i));
            return;
        }
    }
}

} // namespace jcodec::json
