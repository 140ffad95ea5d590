//! # JSON Builder Implementation
//!
//! The builder maintains a stack of `Context` objects:
//!
//! - `Object` context: accumulates key-value pairs in insertion order
//! - `Array` context: accumulates values
//!
//! When `end()` is called, the current context is popped, frozen into a
//! `JsonValue` and added to the parent context (or becomes the result if
//! at root). A nested object opened with `field_object("key")` remembers
//! its key in the context itself.

#include "json/json_builder.hpp"

namespace jcodec::json {

auto JsonBuilder::open(Context::Kind kind, std::string key) -> JsonBuilder& {
    Context ctx;
    ctx.kind = kind;
    ctx.key = std::move(key);
    stack_.push(std::move(ctx));
    return *this;
}

auto JsonBuilder::require(Context::Kind kind, const char* method) -> Context& {
    if (stack_.empty() || stack_.top().kind != kind) {
        throw std::logic_error(std::string("JsonBuilder::") + method + "() called outside " +
                               (kind == Context::Kind::Object ? "object" : "array") +
                               " context");
    }
    return stack_.top();
}

auto JsonBuilder::object() -> JsonBuilder& {
    return open(Context::Kind::Object, {});
}

auto JsonBuilder::array() -> JsonBuilder& {
    return open(Context::Kind::Array, {});
}

auto JsonBuilder::end() -> JsonBuilder& {
    if (stack_.empty()) {
        throw std::logic_error("JsonBuilder::end() called with empty stack");
    }

    Context ctx = std::move(stack_.top());
    stack_.pop();

    JsonValue value = ctx.kind == Context::Kind::Object ? JsonValue(std::move(ctx.members))
                                                        : JsonValue(std::move(ctx.elements));

    if (stack_.empty()) {
        result_ = std::move(value);
        has_result_ = true;
    } else if (stack_.top().kind == Context::Kind::Object) {
        stack_.top().members.emplace_back(std::move(ctx.key), std::move(value));
    } else {
        stack_.top().elements.push_back(std::move(value));
    }

    return *this;
}

// ============================================================================
// Object Field Methods
// ============================================================================

auto JsonBuilder::field(const std::string& key, JsonValue value) -> JsonBuilder& {
    require(Context::Kind::Object, "field").members.emplace_back(key, std::move(value));
    return *this;
}

auto JsonBuilder::field(const std::string& key, const char* value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, const std::string& value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, int value) -> JsonBuilder& {
    return field(key, JsonValue(static_cast<int64_t>(value)));
}

auto JsonBuilder::field(const std::string& key, int64_t value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, double value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, bool value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field_null(const std::string& key) -> JsonBuilder& {
    return field(key, JsonValue());
}

auto JsonBuilder::field_object(const std::string& key) -> JsonBuilder& {
    require(Context::Kind::Object, "field_object");
    return open(Context::Kind::Object, key);
}

auto JsonBuilder::field_array(const std::string& key) -> JsonBuilder& {
    require(Context::Kind::Object, "field_array");
    return open(Context::Kind::Array, key);
}

// ============================================================================
// Array Item Methods
// ============================================================================

auto JsonBuilder::item(JsonValue value) -> JsonBuilder& {
    require(Context::Kind::Array, "item").elements.push_back(std::move(value));
    return *this;
}

auto JsonBuilder::item(const char* value) -> JsonBuilder& {
    return item(JsonValue(value));
}

auto JsonBuilder::item(const std::string& value) -> JsonBuilder& {
    return item(JsonValue(value));
}

auto JsonBuilder::item(int value) -> JsonBuilder& {
    return item(JsonValue(static_cast<int64_t>(value)));
}

auto JsonBuilder::item(int64_t value) -> JsonBuilder& {
    return item(JsonValue(value));
}

auto JsonBuilder::item(double value) -> JsonBuilder& {
    return item(JsonValue(value));
}

auto JsonBuilder::item(bool value) -> JsonBuilder& {
    return item(JsonValue(value));
}

auto JsonBuilder::item_null() -> JsonBuilder& {
    return item(JsonValue());
}

auto JsonBuilder::item_object() -> JsonBuilder& {
    require(Context::Kind::Array, "item_object");
    return open(Context::Kind::Object, {});
}

auto JsonBuilder::item_array() -> JsonBuilder& {
    require(Context::Kind::Array, "item_array");
    return open(Context::Kind::Array, {});
}

// ============================================================================
// Finalization
// ============================================================================

auto JsonBuilder::build() -> JsonValue {
    if (!stack_.empty()) {
        throw std::logic_error("JsonBuilder::build() called with " +
                               std::to_string(stack_.size()) + " unclosed context(s)");
    }
    if (!has_result_) {
        return JsonValue();
    }
    return std::move(result_);
}

auto JsonBuilder::is_complete() const -> bool {
    return stack_.empty() && has_result_;
}

} // namespace jcodec::json
