//! # JSON Cursors
//!
//! A cursor is an immutable description of a position inside a JSON tree.
//! It is a sequence of steps applied from the root:
//!
//! | Step | Text form | Meaning |
//! |------|-----------|---------|
//! | `Field(name)` | `.name` / `."any name"` | Member `name` of an object |
//! | `Element(i)` | `[i]` | Element `i` of an array |
//! | `Filter(T)` | `{obj}`, `{arr}`, `{str}`, `{num}`, `{bool}`, `{null}` | Succeeds only on a value of type `T` |
//!
//! The identity cursor has no steps and renders as `.`.
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json_cursor.hpp"
//! using namespace jcodec::json;
//!
//! auto second_tag = cursor::field("entities").is_object()
//!                       .field("hashtags").is_array().element(1);
//! second_tag.to_string();  // ".entities{obj}.hashtags{arr}[1]"
//!
//! auto user_name = cursor::field("user") >> cursor::field("name");
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jcodec::json {

/// One step of a cursor path.
struct CursorStep {
    enum class Kind : uint8_t { Field, Element, Filter };

    Kind kind;
    std::string name;              ///< Active when `kind == Field`
    size_t index = 0;              ///< Active when `kind == Element`
    JsonType type = JsonType::Null; ///< Active when `kind == Filter`

    static auto field(std::string name) -> CursorStep {
        return CursorStep{Kind::Field, std::move(name), 0, JsonType::Null};
    }
    static auto element(size_t index) -> CursorStep {
        return CursorStep{Kind::Element, {}, index, JsonType::Null};
    }
    static auto filter(JsonType type) -> CursorStep {
        return CursorStep{Kind::Filter, {}, 0, type};
    }

    [[nodiscard]] auto operator==(const CursorStep& other) const -> bool = default;
};

/// An immutable path and filter descriptor into a JSON tree.
///
/// Every builder method returns a new cursor; the receiver is unchanged.
/// Navigation itself lives on `JsonValue` (`get`, `delete_at`).
///
/// # Equality
///
/// Two cursors are equal when their normal forms are equal. The normal
/// form drops a `Filter(Obj)` right before a `Field`, a `Filter(Arr)` right
/// before an `Element` and a `Filter` repeating the one before it, since
/// the following step already implies each of them.
class JsonCursor {
public:
    /// Creates the identity cursor.
    JsonCursor() = default;

    explicit JsonCursor(std::vector<CursorStep> steps) : steps_(std::move(steps)) {}

    // ========================================================================
    // Builders
    // ========================================================================

    [[nodiscard]] auto field(std::string_view name) const -> JsonCursor {
        return with(CursorStep::field(std::string(name)));
    }

    [[nodiscard]] auto element(size_t index) const -> JsonCursor {
        return with(CursorStep::element(index));
    }

    [[nodiscard]] auto filter(JsonType type) const -> JsonCursor {
        return with(CursorStep::filter(type));
    }

    [[nodiscard]] auto is_object() const -> JsonCursor {
        return filter(JsonType::Obj);
    }
    [[nodiscard]] auto is_array() const -> JsonCursor {
        return filter(JsonType::Arr);
    }
    [[nodiscard]] auto is_string() const -> JsonCursor {
        return filter(JsonType::Str);
    }
    [[nodiscard]] auto is_number() const -> JsonCursor {
        return filter(JsonType::Num);
    }
    [[nodiscard]] auto is_bool() const -> JsonCursor {
        return filter(JsonType::Bool);
    }
    [[nodiscard]] auto is_null() const -> JsonCursor {
        return filter(JsonType::Null);
    }

    /// Composes two cursors: the result navigates `*this` and then `next`.
    [[nodiscard]] auto then(const JsonCursor& next) const -> JsonCursor;

    // ========================================================================
    // Inspection
    // ========================================================================

    [[nodiscard]] auto steps() const -> const std::vector<CursorStep>& {
        return steps_;
    }

    [[nodiscard]] auto is_identity() const -> bool {
        return steps_.empty();
    }

    /// Returns the cursor without its last step. The identity is its own parent.
    [[nodiscard]] auto parent() const -> JsonCursor;

    /// Returns the last step, or `nullptr` for the identity.
    [[nodiscard]] auto last() const -> const CursorStep* {
        return steps_.empty() ? nullptr : &steps_.back();
    }

    /// Returns the steps with the implied filters removed.
    [[nodiscard]] auto normalized() const -> std::vector<CursorStep>;

    /// Renders the cursor in its text form (see `parse_cursor`).
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const JsonCursor& other) const -> bool {
        return normalized() == other.normalized();
    }

    [[nodiscard]] auto operator!=(const JsonCursor& other) const -> bool {
        return !(*this == other);
    }

    [[nodiscard]] auto hash() const -> size_t;

private:
    std::vector<CursorStep> steps_;

    [[nodiscard]] auto with(CursorStep step) const -> JsonCursor {
        JsonCursor next = *this;
        next.steps_.push_back(std::move(step));
        return next;
    }
};

/// Composition, read left to right: `a >> b` navigates `a` and then `b`.
[[nodiscard]] inline auto operator>>(const JsonCursor& first, const JsonCursor& second)
    -> JsonCursor {
    return first.then(second);
}

/// Parses the text form of a cursor.
///
/// # Grammar
///
/// ```text
/// cursor := "." | step+
/// step   := "." ident | "." string | "[" digits "]" | "{" type "}"
/// ident  := [A-Za-z0-9_-]+
/// type   := "obj" | "arr" | "str" | "num" | "bool" | "null"
/// ```
///
/// # Returns
///
/// The cursor, or a `JsonError` whose `offset` points at the offending byte.
[[nodiscard]] auto parse_cursor(std::string_view text) -> Result<JsonCursor, JsonError>;

/// Free cursor builders.
///
/// ```cpp
/// auto c = cursor::field("user").is_object().field("name");
/// ```
namespace cursor {

[[nodiscard]] inline auto identity() -> JsonCursor {
    return JsonCursor();
}

[[nodiscard]] inline auto field(std::string_view name) -> JsonCursor {
    return JsonCursor().field(name);
}

[[nodiscard]] inline auto element(size_t index) -> JsonCursor {
    return JsonCursor().element(index);
}

[[nodiscard]] inline auto filter(JsonType type) -> JsonCursor {
    return JsonCursor().filter(type);
}

} // namespace cursor

} // namespace jcodec::json

template <> struct std::hash<jcodec::json::JsonCursor> {
    auto operator()(const jcodec::json::JsonCursor& cursor) const noexcept -> size_t {
        return cursor.hash();
    }
};
