//! # JSON Tree Traversal
//!
//! Cursor navigation (`get`, `delete_at`) and whole-tree rewrites
//! (`transform_down_with_cursor`, `transform_down`, `transform_up`).
//!
//! Every operation returns a new tree. Containers on the path to a change
//! are copied; every other branch is shared with the input.

#include "json/json_cursor.hpp"
#include "log/log.hpp"

namespace jcodec::json {

namespace {

/// Resolves one structural step. The step must not be a filter.
auto descend(const JsonValue& node, const CursorStep& step) -> Result<JsonValue, CursorError> {
    if (step.kind == CursorStep::Kind::Field) {
        if (!node.is_object()) {
            return CursorError::type_mismatch(JsonType::Obj, node.type());
        }
        const JsonValue* child = node.find(step.name);
        if (!child) {
            return CursorError::no_such_field(step.name);
        }
        return *child;
    }
    if (!node.is_array()) {
        return CursorError::type_mismatch(JsonType::Arr, node.type());
    }
    const auto& elements = node.as_array();
    if (step.index >= elements.size()) {
        return CursorError::index_out_of_bounds(step.index, elements.size());
    }
    return elements[step.index];
}

/// Rebuilds `node` without the target of `steps[at..end)`.
///
/// The path is known to resolve: `delete_at` has already navigated it.
auto remove_path(const JsonValue& node, const std::vector<CursorStep>& steps, size_t at,
                 size_t end) -> JsonValue {
    const CursorStep& step = steps[at];
    if (step.kind == CursorStep::Kind::Filter) {
        return remove_path(node, steps, at + 1, end);
    }

    bool last = at + 1 == end;
    if (step.kind == CursorStep::Kind::Field) {
        JsonObject members;
        members.reserve(node.size());
        bool replaced = false;
        for (const auto& member : node.as_object()) {
            if (member.first != step.name) {
                members.push_back(member);
            } else if (!last && !replaced) {
                members.emplace_back(member.first, remove_path(member.second, steps, at + 1, end));
                replaced = true;
            } else if (!last) {
                members.push_back(member);
            }
        }
        return JsonValue(std::move(members));
    }

    JsonArray elements = node.as_array();
    if (last) {
        elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(step.index));
    } else {
        elements[step.index] = remove_path(elements[step.index], steps, at + 1, end);
    }
    return JsonValue(std::move(elements));
}

auto rewrite_down(const JsonValue& node, const JsonCursor& at, const CursorRule& rule)
    -> JsonValue {
    std::optional<JsonValue> replaced = rule(node, at);
    const JsonValue& current = replaced ? *replaced : node;

    if (current.is_object()) {
        JsonCursor base = at.is_object();
        JsonObject members;
        members.reserve(current.size());
        for (const auto& [key, value] : current.as_object()) {
            members.emplace_back(key, rewrite_down(value, base.field(key), rule));
        }
        return JsonValue(std::move(members));
    }
    if (current.is_array()) {
        JsonCursor base = at.is_array();
        const auto& source = current.as_array();
        JsonArray elements;
        elements.reserve(source.size());
        for (size_t i = 0; i < source.size(); ++i) {
            elements.push_back(rewrite_down(source[i], base.element(i), rule));
        }
        return JsonValue(std::move(elements));
    }
    return current;
}

/// Rebuilds a container with each child passed through `f`.
template <typename F> auto map_children(const JsonValue& node, F&& f) -> JsonValue {
    if (node.is_object()) {
        JsonObject members;
        members.reserve(node.size());
        for (const auto& [key, value] : node.as_object()) {
            members.emplace_back(key, f(value));
        }
        return JsonValue(std::move(members));
    }
    if (node.is_array()) {
        JsonArray elements;
        elements.reserve(node.size());
        for (const auto& value : node.as_array()) {
            elements.push_back(f(value));
        }
        return JsonValue(std::move(elements));
    }
    return node;
}

} // namespace

// ============================================================================
// Navigation
// ============================================================================

auto JsonValue::get(const JsonCursor& cursor) const -> Result<JsonValue, CursorError> {
    JsonValue current = *this;
    for (const auto& step : cursor.steps()) {
        if (step.kind == CursorStep::Kind::Filter) {
            if (current.type() != step.type) {
                return CursorError::type_mismatch(step.type, current.type());
            }
            continue;
        }
        auto next = descend(current, step);
        if (is_err(next)) {
            return next;
        }
        // Move out first: `next` may be the last owner of a branch of `current`
        JsonValue child = std::move(unwrap(next));
        current = std::move(child);
    }
    return current;
}

auto JsonValue::delete_at(const JsonCursor& cursor) const -> Result<JsonValue, CursorError> {
    const auto& steps = cursor.steps();

    // Trailing filters guard the target itself
    size_t path_end = steps.size();
    while (path_end > 0 && steps[path_end - 1].kind == CursorStep::Kind::Filter) {
        --path_end;
    }

    std::vector<CursorStep> path(steps.begin(),
                                 steps.begin() + static_cast<std::ptrdiff_t>(path_end));
    auto target = get(JsonCursor(std::move(path)));
    if (is_err(target)) {
        const auto& error = unwrap_err(target);
        if (error.kind == CursorError::Kind::TypeMismatch) {
            JCODEC_LOG_TRACE("cursor", "delete at " << cursor.to_string()
                                                    << " is a no-op: " << error.message);
            return *this;
        }
        return error;
    }

    for (size_t i = path_end; i < steps.size(); ++i) {
        if (unwrap(target).type() != steps[i].type) {
            JCODEC_LOG_TRACE("cursor", "delete at " << cursor.to_string()
                                                    << " is a no-op: target is "
                                                    << type_name(unwrap(target).type()));
            return *this;
        }
    }

    if (path_end == 0) {
        return JsonValue();
    }
    return remove_path(*this, steps, 0, path_end);
}

// ============================================================================
// Rewrites
// ============================================================================

auto JsonValue::transform_down_with_cursor(const CursorRule& rule) const -> JsonValue {
    return rewrite_down(*this, JsonCursor(), rule);
}

auto JsonValue::transform_down(const std::function<JsonValue(const JsonValue&)>& f) const
    -> JsonValue {
    JsonValue replaced = f(*this);
    return map_children(replaced,
                        [&f](const JsonValue& child) { return child.transform_down(f); });
}

auto JsonValue::transform_up(const std::function<JsonValue(const JsonValue&)>& f) const
    -> JsonValue {
    return f(map_children(*this, [&f](const JsonValue& child) { return child.transform_up(f); }));
}

} // namespace jcodec::json
