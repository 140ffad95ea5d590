//! # JSON Parser
//!
//! The `Decoder<JsonValue>` instance and `parse_json`. Parsing is a
//! recursive descent over the lexer primitives; nesting is bounded by
//! `CodecOptions::max_depth` so hostile input cannot exhaust the stack.
//!
//! Errors carry the path to the offending value:
//!
//! ```text
//! parse_json(R"({"a": [1, tru]})")  =>  .a[1](expected 'true')
//! ```

#include "json/json_decoder.hpp"

namespace jcodec::json {

namespace {

auto parse_value(const DecodeTrace& trace, JsonReader& in, size_t depth)
    -> Result<JsonValue, DecodeError> {
    int c = lexer::peek(in);
    switch (c) {
    case 'n': {
        auto null = lexer::null_literal(trace, in);
        if (is_err(null)) {
            return unwrap_err(null);
        }
        return JsonValue();
    }
    case 't':
    case 'f': {
        auto b = lexer::boolean(trace, in);
        if (is_err(b)) {
            return unwrap_err(b);
        }
        return JsonValue(unwrap(b));
    }
    case '"': {
        auto s = lexer::string(trace, in);
        if (is_err(s)) {
            return unwrap_err(s);
        }
        return JsonValue(std::move(unwrap(s)));
    }
    case '[': {
        if (depth >= CodecOptions::max_depth) {
            return DecodeError::make("maximum nesting depth exceeded", trace);
        }
        in.read();
        JsonArray elements;
        auto more = lexer::first_array(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return JsonValue(std::move(elements));
            }
            auto element = parse_value(trace.with_index(elements.size()), in, depth + 1);
            if (is_err(element)) {
                return element;
            }
            elements.push_back(std::move(unwrap(element)));
            more = lexer::next_array(trace, in);
        }
    }
    case '{': {
        if (depth >= CodecOptions::max_depth) {
            return DecodeError::make("maximum nesting depth exceeded", trace);
        }
        in.read();
        JsonObject members;
        auto more = lexer::first_object(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return JsonValue(std::move(members));
            }
            auto key = lexer::field_name(trace, in);
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto member = parse_value(trace.with_field(unwrap(key)), in, depth + 1);
            if (is_err(member)) {
                return member;
            }
            members.emplace_back(std::move(unwrap(key)), std::move(unwrap(member)));
            more = lexer::next_object(trace, in);
        }
    }
    default: {
        auto n = lexer::number(trace, in);
        if (is_err(n)) {
            return unwrap_err(n);
        }
        return JsonValue(unwrap(n));
    }
    }
}

} // namespace

auto JsonValueDecoder::unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
    -> Result<JsonValue, DecodeError> {
    return parse_value(trace, in, 0);
}

auto DoubleDecoder::unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
    -> Result<double, DecodeError> {
    if (lexer::peek(in) == '"') {
        auto s = lexer::string(trace, in);
        if (is_err(s)) {
            return unwrap_err(s);
        }
        const std::string& text = unwrap(s);
        if (text == "NaN") {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (text == "Infinity") {
            return std::numeric_limits<double>::infinity();
        }
        if (text == "-Infinity") {
            return -std::numeric_limits<double>::infinity();
        }
        return DecodeError::make("expected a number", trace);
    }
    auto n = lexer::number(trace, in);
    if (is_err(n)) {
        return unwrap_err(n);
    }
    return unwrap(n).as_f64();
}

auto parse_json(std::string_view text) -> Result<JsonValue, DecodeError> {
    auto result = decoder<JsonValue>()->decode(text);
    if (is_err(result)) {
        JCODEC_LOG_DEBUG("json", "parse failed: " << unwrap_err(result).to_string());
    }
    return result;
}

} // namespace jcodec::json
