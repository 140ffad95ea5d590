//! # JSON Cursor Implementation
//!
//! Composition, normal form, hashing and the text form of cursors.
//! Navigation over a tree is in `json_traversal.cpp`.

#include "json/json_cursor.hpp"

#include "json/json_lexer.hpp"
#include "json/json_writer.hpp"

#include <charconv>

namespace jcodec::json {

namespace {

auto is_ident_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

auto is_plain_name(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!is_ident_char(c)) {
            return false;
        }
    }
    return true;
}

auto filter_name(JsonType type) -> const char* {
    switch (type) {
    case JsonType::Null:
        return "null";
    case JsonType::Bool:
        return "bool";
    case JsonType::Num:
        return "num";
    case JsonType::Str:
        return "str";
    case JsonType::Arr:
        return "arr";
    case JsonType::Obj:
        return "obj";
    }
    return "?";
}

auto filter_type(std::string_view name) -> std::optional<JsonType> {
    static constexpr JsonType ALL[] = {JsonType::Null, JsonType::Bool, JsonType::Num,
                                       JsonType::Str,  JsonType::Arr,  JsonType::Obj};
    for (JsonType type : ALL) {
        if (name == filter_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

auto error_at(std::string message, size_t offset) -> JsonError {
    return JsonError::make(std::move(message), 1, offset + 1, offset);
}

} // namespace

auto JsonCursor::then(const JsonCursor& next) const -> JsonCursor {
    JsonCursor result = *this;
    result.steps_.insert(result.steps_.end(), next.steps_.begin(), next.steps_.end());
    return result;
}

auto JsonCursor::parent() const -> JsonCursor {
    if (steps_.empty()) {
        return *this;
    }
    return JsonCursor(std::vector<CursorStep>(steps_.begin(), steps_.end() - 1));
}

auto JsonCursor::normalized() const -> std::vector<CursorStep> {
    // Walk backwards so that each filter is compared with the step that
    // actually follows it once redundant filters are gone.
    std::vector<CursorStep> reversed;
    reversed.reserve(steps_.size());
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        const CursorStep& step = *it;
        if (step.kind == CursorStep::Kind::Filter && !reversed.empty()) {
            const CursorStep& next = reversed.back();
            if (step.type == JsonType::Obj && next.kind == CursorStep::Kind::Field) {
                continue;
            }
            if (step.type == JsonType::Arr && next.kind == CursorStep::Kind::Element) {
                continue;
            }
            if (next == step) {
                continue;
            }
        }
        reversed.push_back(step);
    }
    return std::vector<CursorStep>(reversed.rbegin(), reversed.rend());
}

auto JsonCursor::hash() const -> size_t {
    size_t seed = 0;
    for (const auto& step : normalized()) {
        size_t h = static_cast<size_t>(step.kind);
        switch (step.kind) {
        case CursorStep::Kind::Field:
            h ^= std::hash<std::string>{}(step.name) << 1;
            break;
        case CursorStep::Kind::Element:
            h ^= std::hash<size_t>{}(step.index) << 1;
            break;
        case CursorStep::Kind::Filter:
            h ^= static_cast<size_t>(step.type) << 4;
            break;
        }
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto JsonCursor::to_string() const -> std::string {
    if (steps_.empty()) {
        return ".";
    }
    StringWriter out;
    for (const auto& step : steps_) {
        switch (step.kind) {
        case CursorStep::Kind::Field:
            out.write('.');
            if (is_plain_name(step.name)) {
                out.write(step.name);
            } else {
                write_escaped(step.name, out);
            }
            break;
        case CursorStep::Kind::Element:
            out.write('[');
            out.write(std::to_string(step.index));
            out.write(']');
            break;
        case CursorStep::Kind::Filter:
            out.write('{');
            out.write(filter_name(step.type));
            out.write('}');
            break;
        }
    }
    return out.take();
}

// ============================================================================
// Text Form
// ============================================================================

auto parse_cursor(std::string_view text) -> Result<JsonCursor, JsonError> {
    if (text.empty()) {
        return error_at("empty cursor", 0);
    }
    if (text == ".") {
        return JsonCursor();
    }

    std::vector<CursorStep> steps;
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '.') {
            ++pos;
            if (pos < text.size() && text[pos] == '"') {
                StringReader reader(text.substr(pos));
                auto name = lexer::string(DecodeTrace(), reader);
                if (is_err(name)) {
                    return error_at("invalid quoted field: " + unwrap_err(name).message, pos);
                }
                steps.push_back(CursorStep::field(std::move(unwrap(name))));
                pos += reader.offset();
                continue;
            }
            size_t start = pos;
            while (pos < text.size() && is_ident_char(text[pos])) {
                ++pos;
            }
            if (pos == start) {
                return error_at("expected field name", pos);
            }
            steps.push_back(CursorStep::field(std::string(text.substr(start, pos - start))));
        } else if (c == '[') {
            size_t start = ++pos;
            size_t index = 0;
            auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), index);
            if (ec != std::errc{} || ptr == text.data() + pos) {
                return error_at("expected array index", start);
            }
            pos = static_cast<size_t>(ptr - text.data());
            if (pos >= text.size() || text[pos] != ']') {
                return error_at("expected ']'", pos);
            }
            ++pos;
            steps.push_back(CursorStep::element(index));
        } else if (c == '{') {
            size_t start = ++pos;
            size_t close = text.find('}', pos);
            if (close == std::string_view::npos) {
                return error_at("expected '}'", text.size());
            }
            auto type = filter_type(text.substr(start, close - start));
            if (!type) {
                return error_at("unknown filter '" + std::string(text.substr(start, close - start)) +
                                    "'",
                                start);
            }
            steps.push_back(CursorStep::filter(*type));
            pos = close + 1;
        } else {
            return error_at(std::string("unexpected '") + c + "'", pos);
        }
    }
    return JsonCursor(std::move(steps));
}

} // namespace jcodec::json
