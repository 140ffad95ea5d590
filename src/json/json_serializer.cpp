//! # JSON Serializer
//!
//! This module implements serialization for `JsonValue`. It is the
//! `Encoder<JsonValue>` instance; `JsonValue::to_string` and friends are
//! thin wrappers around it.
//!
//! ## Layout
//!
//! Compact output has no whitespace. Pretty output uses the same layout as
//! derived product encoders:
//!
//! ```text
//! {
//!   "id" : 8500,
//!   "entities" : {
//!     "hashtags" : ["twitter", "developer"]
//!   }
//! }
//! ```
//!
//! Empty objects are written as `{}` in both modes. Integers are written
//! exactly; doubles use the shortest round-trip form.

#include "json/json_encoder.hpp"

#include <ostream>

namespace jcodec::json {

void JsonValueEncoder::unsafe_encode(const JsonValue& value, const Indent& indent,
                                     JsonWriter& out) const {
    switch (value.type()) {
    case JsonType::Null:
        out.write("null");
        return;
    case JsonType::Bool:
        out.write(value.as_bool() ? "true" : "false");
        return;
    case JsonType::Num:
        write_number(value.as_number(), out);
        return;
    case JsonType::Str:
        write_escaped(value.as_string(), out);
        return;
    case JsonType::Arr: {
        out.write('[');
        bool first = true;
        for (const auto& elem : value.as_array()) {
            if (first) {
                first = false;
            } else {
                out.write(indent ? ", " : ",");
            }
            unsafe_encode(elem, indent, out);
        }
        out.write(']');
        return;
    }
    case JsonType::Obj: {
        const auto& members = value.as_object();
        if (members.empty()) {
            out.write("{}");
            return;
        }
        out.write('{');
        Indent inner = bump(indent);
        pad(inner, out);
        bool first = true;
        for (const auto& [key, member] : members) {
            if (first) {
                first = false;
            } else {
                out.write(',');
                pad(inner, out);
            }
            write_escaped(key, out);
            write_colon(indent, out);
            unsafe_encode(member, inner, out);
        }
        pad(indent, out);
        out.write('}');
        return;
    }
    }
}

auto JsonValue::to_string() const -> std::string {
    return encoder<JsonValue>()->encode(*this);
}

auto JsonValue::to_string_pretty() const -> std::string {
    return encoder<JsonValue>()->encode(*this, 0);
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    write_json(*this, os);
    return os;
}

auto JsonValue::write_to_pretty(std::ostream& os) const -> std::ostream& {
    write_json(*this, os, 0);
    return os;
}

} // namespace jcodec::json
