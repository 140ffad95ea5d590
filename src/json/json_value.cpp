//! # JSON Value Implementation
//!
//! This module implements equality and hashing for `JsonValue` and the
//! out-of-line parts of the error types. Serialization lives in
//! `json_serializer.cpp` and cursor navigation in `json_traversal.cpp`.
//!
//! ## Object Equality
//!
//! Objects are compared as multisets of `(key, value)` members: every
//! member of one object must be paired with a distinct equal member of the
//! other. Member order is irrelevant, duplicate keys are significant.
//!
//! ```cpp
//! auto a = json_object({{"x", json_int(1)}, {"y", json_int(2)}});
//! auto b = json_object({{"y", json_int(2)}, {"x", json_int(1)}});
//! assert(a == b);
//! assert(a.hash() == b.hash());
//! ```

#include "json/json_value.hpp"

#include <cmath>

namespace jcodec::json {

namespace {

auto hash_combine(size_t seed, size_t value) -> size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

auto type_name(JsonType type) -> const char* {
    switch (type) {
    case JsonType::Null:
        return "Null";
    case JsonType::Bool:
        return "Bool";
    case JsonType::Num:
        return "Num";
    case JsonType::Str:
        return "Str";
    case JsonType::Arr:
        return "Arr";
    case JsonType::Obj:
        return "Obj";
    }
    return "?";
}

// ============================================================================
// JsonNumber
// ============================================================================

auto JsonNumber::try_as_i64() const -> std::optional<int64_t> {
    switch (kind) {
    case Kind::Int64:
        return i64;
    case Kind::Uint64:
        if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(u64);
        }
        return std::nullopt;
    case Kind::Double:
        // -2^63 is exact as a double, 2^63 is the first value out of range
        if (std::trunc(f64) == f64 && f64 >= -9223372036854775808.0 &&
            f64 < 9223372036854775808.0) {
            return static_cast<int64_t>(f64);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

auto JsonNumber::try_as_u64() const -> std::optional<uint64_t> {
    switch (kind) {
    case Kind::Int64:
        if (i64 >= 0) {
            return static_cast<uint64_t>(i64);
        }
        return std::nullopt;
    case Kind::Uint64:
        return u64;
    case Kind::Double:
        if (std::trunc(f64) == f64 && f64 >= 0.0 && f64 < 18446744073709551616.0) {
            return static_cast<uint64_t>(f64);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

auto JsonNumber::hash() const -> size_t {
    double value = as_f64();
    if (value == 0.0) {
        value = 0.0; // -0.0 == 0.0
    }
    return std::hash<double>{}(value);
}

// ============================================================================
// JsonValue
// ============================================================================

auto JsonValue::find(std::string_view key) const -> const JsonValue* {
    auto* obj = std::get_if<Rc<const JsonObject>>(&data);
    if (!obj) {
        return nullptr;
    }
    for (const auto& [name, value] : **obj) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    // Different variant types are not equal
    if (data.index() != other.data.index()) {
        return false;
    }

    switch (type()) {
    case JsonType::Null:
        return true;
    case JsonType::Bool:
        return as_bool() == other.as_bool();
    case JsonType::Num:
        return as_number() == other.as_number();
    case JsonType::Str:
        return as_string() == other.as_string();
    case JsonType::Arr: {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (&arr1 == &arr2) {
            return true;
        }
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }
    case JsonType::Obj: {
        const auto& obj1 = as_object();
        const auto& obj2 = other.as_object();
        if (&obj1 == &obj2) {
            return true;
        }
        if (obj1.size() != obj2.size()) {
            return false;
        }
        // Pair each member with a distinct unused equal member
        std::vector<bool> used(obj2.size(), false);
        for (const auto& member : obj1) {
            bool matched = false;
            for (size_t j = 0; j < obj2.size(); ++j) {
                if (!used[j] && obj2[j].first == member.first && obj2[j].second == member.second) {
                    used[j] = true;
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

auto JsonValue::hash() const -> size_t {
    size_t seed = data.index();
    switch (type()) {
    case JsonType::Null:
        return seed;
    case JsonType::Bool:
        return hash_combine(seed, as_bool() ? 1 : 0);
    case JsonType::Num:
        return hash_combine(seed, as_number().hash());
    case JsonType::Str:
        return hash_combine(seed, std::hash<std::string>{}(as_string()));
    case JsonType::Arr:
        for (const auto& elem : as_array()) {
            seed = hash_combine(seed, elem.hash());
        }
        return seed;
    case JsonType::Obj: {
        // Commutative sum so that member order does not matter
        size_t members = 0;
        for (const auto& [key, value] : as_object()) {
            members += hash_combine(std::hash<std::string>{}(key), value.hash());
        }
        return hash_combine(seed, members);
    }
    }
    return seed;
}

// ============================================================================
// Error Types
// ============================================================================

auto CursorError::no_such_field(std::string_view name) -> CursorError {
    return CursorError{Kind::NoSuchField, "No such field: '" + std::string(name) + "'"};
}

auto CursorError::index_out_of_bounds(size_t index, size_t size) -> CursorError {
    return CursorError{Kind::IndexOutOfBounds, "Index out of bounds: " + std::to_string(index) +
                                                   " (size " + std::to_string(size) + ")"};
}

auto CursorError::type_mismatch(JsonType expected, JsonType actual) -> CursorError {
    return CursorError{Kind::TypeMismatch, std::string("Type mismatch: expected ") +
                                               type_name(expected) + ", found " +
                                               type_name(actual)};
}

auto TraceStep::to_string() const -> std::string {
    switch (kind) {
    case Kind::Field:
        return "." + name;
    case Kind::Index:
        return "[" + std::to_string(index) + "]";
    case Kind::Variant:
        return "{" + name + "}";
    }
    return {};
}

auto DecodeError::make(std::string message, const DecodeTrace& at) -> DecodeError {
    const auto& steps = at.steps();
    return DecodeError{std::move(message), std::vector<TraceStep>(steps.rbegin(), steps.rend())};
}

auto DecodeError::to_string() const -> std::string {
    std::string result;
    for (auto it = trace.rbegin(); it != trace.rend(); ++it) {
        result += it->to_string();
    }
    result += "(" + message + ")";
    return result;
}

} // namespace jcodec::json
