//! # JSON Encoders
//!
//! Streaming value-to-text encoders. An `Encoder<T>` writes a `T` straight
//! into a `JsonWriter`; nested encoders share the same writer, so no
//! intermediate strings are built.
//!
//! ## Output Modes
//!
//! | Mode | Indent | Object layout | Array layout |
//! |------|--------|---------------|--------------|
//! | Compact | `std::nullopt` | `{"a":1,"b":2}` | `[1,2]` |
//! | Pretty | level `N` | members on new lines at `2 * (N + 1)` spaces, `" : "` | `[1, 2]` |
//!
//! ## Skipping Fields
//!
//! `Encoder::is_nothing` lets an encoder declare a value absent. Object
//! encoders (derived products and maps) omit members whose value is
//! nothing; `std::optional` uses it for `std::nullopt`.
//!
//! ## Built-in Instances
//!
//! `encoder<T>()` returns the encoder for:
//!
//! - `bool`, every integral type, `float`, `double`, `char`, `std::string`
//! - `std::optional<T>`
//! - `std::vector`, `std::list`, `std::deque`, `std::set`, `std::unordered_set` (arrays)
//! - `std::map`, `std::unordered_map` with string or integral keys (objects)
//! - `std::pair`, `std::tuple` (fixed-length arrays)
//! - `JsonValue`
//! - any type with a `JsonDerive<T>` specialization
//!
//! ## Example
//!
//! ```cpp
//! std::vector<std::optional<int>> values{1, std::nullopt, 3};
//! to_json(values);         // "[1,null,3]"
//!
//! std::map<std::string, int> counts{{"a", 1}, {"b", 2}};
//! to_json_pretty(counts);  // "{\n  \"a\" : 1,\n  \"b\" : 2\n}"
//! ```

#pragma once

#include "common.hpp"
#include "json/json_codec.hpp"
#include "json/json_value.hpp"
#include "json/json_writer.hpp"

#include <deque>
#include <list>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace jcodec::json {

// ============================================================================
// Encoder
// ============================================================================

/// Streaming encoder for values of type `T`.
///
/// Implementations override `unsafe_encode`. Encoding never fails.
template <typename T> class Encoder {
public:
    virtual ~Encoder() = default;

    /// Writes `value` to `out` at the given indentation.
    ///
    /// In pretty mode `indent` is the level of the value itself: members of
    /// an object go one level deeper and the closing brace goes back to
    /// `indent`.
    virtual void unsafe_encode(const T& value, const Indent& indent, JsonWriter& out) const = 0;

    /// Returns `true` if `value` should be omitted from an enclosing object.
    [[nodiscard]] virtual auto is_nothing(const T& /*value*/) const -> bool {
        return false;
    }

    /// Encodes `value` to a string (compact unless `indent` is given).
    [[nodiscard]] auto encode(const T& value, const Indent& indent = std::nullopt) const
        -> std::string {
        StringWriter out;
        unsafe_encode(value, indent, out);
        return out.take();
    }
};

/// Writes the separator between an object key and its value.
inline void write_colon(const Indent& indent, JsonWriter& out) {
    out.write(indent ? " : " : ":");
}

/// Resolves the encoder instance for `T`.
///
/// The primary template handles user types through `JsonDerive<T>`;
/// built-in types are covered by the specializations below.
template <typename T, typename Enable = void> struct EncoderInstance {
    static auto get() -> EncoderRef<T> {
        return JsonDerive<T>::codec().encoder;
    }
};

/// Returns the encoder for `T`.
template <typename T> [[nodiscard]] auto encoder() -> EncoderRef<T> {
    return EncoderInstance<T>::get();
}

// ============================================================================
// Combinators
// ============================================================================

/// Encoder for `B` that converts to `A` first.
template <typename B, typename A, typename F> class ContramapEncoder final : public Encoder<B> {
public:
    ContramapEncoder(EncoderRef<A> inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

    void unsafe_encode(const B& value, const Indent& indent, JsonWriter& out) const override {
        inner_->unsafe_encode(f_(value), indent, out);
    }

    [[nodiscard]] auto is_nothing(const B& value) const -> bool override {
        return inner_->is_nothing(f_(value));
    }

private:
    EncoderRef<A> inner_;
    F f_;
};

/// Builds an encoder for `B` from an encoder for `A` and a function `B -> A`.
/// The nothing-hook is forwarded through the same function.
///
/// # Example
///
/// ```cpp
/// struct UserId { int64_t value; };
/// auto enc = contramap<UserId>(encoder<int64_t>(), [](const UserId& id) { return id.value; });
/// ```
template <typename B, typename A, typename F>
[[nodiscard]] auto contramap(EncoderRef<A> inner, F f) -> EncoderRef<B> {
    return make_rc<const ContramapEncoder<B, A, F>>(std::move(inner), std::move(f));
}

/// Invariant map: only the reverse function `g: B -> A` is used by encoding.
template <typename B, typename A, typename F, typename G>
[[nodiscard]] auto xmap(EncoderRef<A> inner, F /*f*/, G g) -> EncoderRef<B> {
    return contramap<B>(std::move(inner), std::move(g));
}

// ============================================================================
// Object Keys
// ============================================================================

/// Converts map keys to object member names.
template <typename K, typename Enable = void> struct FieldEncoder;

template <> struct FieldEncoder<std::string> {
    static auto encode_field(const std::string& key) -> const std::string& {
        return key;
    }
};

template <typename K>
struct FieldEncoder<K, std::enable_if_t<std::is_integral_v<K> && !std::is_same_v<K, bool>>> {
    static auto encode_field(const K& key) -> std::string {
        return std::to_string(key);
    }
};

// ============================================================================
// Scalar Encoders
// ============================================================================

class BoolEncoder final : public Encoder<bool> {
public:
    void unsafe_encode(const bool& value, const Indent& /*indent*/,
                       JsonWriter& out) const override {
        out.write(value ? "true" : "false");
    }
};

template <typename T> class IntegralEncoder final : public Encoder<T> {
public:
    void unsafe_encode(const T& value, const Indent& /*indent*/, JsonWriter& out) const override {
        out.write(std::to_string(value));
    }
};

/// Finite values use the shortest round-trip form; NaN and infinities are
/// written as the strings `"NaN"`, `"Infinity"` and `"-Infinity"`.
class DoubleEncoder final : public Encoder<double> {
public:
    void unsafe_encode(const double& value, const Indent& /*indent*/,
                       JsonWriter& out) const override {
        write_number(JsonNumber(value), out);
    }
};

class StringEncoder final : public Encoder<std::string> {
public:
    void unsafe_encode(const std::string& value, const Indent& /*indent*/,
                       JsonWriter& out) const override {
        write_escaped(value, out);
    }
};

/// `JsonValue` in the same layout as derived encoders produce.
class JsonValueEncoder final : public Encoder<JsonValue> {
public:
    void unsafe_encode(const JsonValue& value, const Indent& indent,
                       JsonWriter& out) const override;
};

// ============================================================================
// Container Encoders
// ============================================================================

/// `std::nullopt` is nothing and encodes as `null`.
template <typename A> class OptionalEncoder final : public Encoder<std::optional<A>> {
public:
    explicit OptionalEncoder(EncoderRef<A> inner) : inner_(std::move(inner)) {}

    void unsafe_encode(const std::optional<A>& value, const Indent& indent,
                       JsonWriter& out) const override {
        if (!value) {
            out.write("null");
            return;
        }
        inner_->unsafe_encode(*value, indent, out);
    }

    [[nodiscard]] auto is_nothing(const std::optional<A>& value) const -> bool override {
        return !value.has_value();
    }

private:
    EncoderRef<A> inner_;
};

/// Any iterable container as an array. Elements stay on one line, separated
/// by `", "` in pretty mode.
template <typename C> class SequenceEncoder final : public Encoder<C> {
public:
    using Element = typename C::value_type;

    explicit SequenceEncoder(EncoderRef<Element> inner) : inner_(std::move(inner)) {}

    void unsafe_encode(const C& values, const Indent& indent, JsonWriter& out) const override {
        out.write('[');
        bool first = true;
        for (const Element& value : values) {
            if (first) {
                first = false;
            } else {
                out.write(indent ? ", " : ",");
            }
            inner_->unsafe_encode(value, indent, out);
        }
        out.write(']');
    }

private:
    EncoderRef<Element> inner_;
};

/// Any container of key-value pairs as an object, in iteration order.
///
/// Members whose value is nothing are skipped; an empty (or all-nothing)
/// container encodes as `{}` in pretty mode too.
template <typename C> class KeyListEncoder final : public Encoder<C> {
public:
    using Key = std::remove_const_t<typename C::value_type::first_type>;
    using Value = typename C::value_type::second_type;

    explicit KeyListEncoder(EncoderRef<Value> inner) : inner_(std::move(inner)) {}

    void unsafe_encode(const C& entries, const Indent& indent, JsonWriter& out) const override {
        out.write('{');
        Indent inner_indent = bump(indent);
        bool first = true;
        for (const auto& [key, value] : entries) {
            if (inner_->is_nothing(value)) {
                continue;
            }
            if (first) {
                first = false;
            } else {
                out.write(',');
            }
            pad(inner_indent, out);
            write_escaped(FieldEncoder<Key>::encode_field(key), out);
            write_colon(indent, out);
            inner_->unsafe_encode(value, inner_indent, out);
        }
        if (!first) {
            pad(indent, out);
        }
        out.write('}');
    }

private:
    EncoderRef<Value> inner_;
};

/// `std::pair` and `std::tuple` as fixed-length arrays.
template <typename P, typename... Ts> class TupleEncoder final : public Encoder<P> {
public:
    TupleEncoder() : inner_(encoder<Ts>()...) {}

    void unsafe_encode(const P& value, const Indent& indent, JsonWriter& out) const override {
        out.write('[');
        encode_elements(value, indent, out, std::index_sequence_for<Ts...>{});
        out.write(']');
    }

private:
    std::tuple<EncoderRef<Ts>...> inner_;

    template <size_t... Is>
    void encode_elements(const P& value, const Indent& indent, JsonWriter& out,
                         std::index_sequence<Is...> /*indices*/) const {
        ((Is == 0 ? void() : out.write(indent ? ", " : ","),
          std::get<Is>(inner_)->unsafe_encode(std::get<Is>(value), indent, out)),
         ...);
    }
};

/// Encodes a list of key-value pairs as an object.
///
/// Not an instance: `encoder<std::vector<std::pair<K, V>>>()` is an array
/// of two-element arrays.
template <typename K, typename V>
[[nodiscard]] auto keylist() -> EncoderRef<std::vector<std::pair<K, V>>> {
    return make_rc<const KeyListEncoder<std::vector<std::pair<K, V>>>>(encoder<V>());
}

// ============================================================================
// Instances
// ============================================================================

namespace detail {

template <typename T> struct is_plain_integral
    : std::bool_constant<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                         !std::is_same_v<T, char>> {};

} // namespace detail

template <> struct EncoderInstance<bool> {
    static auto get() -> EncoderRef<bool> {
        static const EncoderRef<bool> instance = make_rc<const BoolEncoder>();
        return instance;
    }
};

template <typename T>
struct EncoderInstance<T, std::enable_if_t<detail::is_plain_integral<T>::value>> {
    static auto get() -> EncoderRef<T> {
        static const EncoderRef<T> instance = make_rc<const IntegralEncoder<T>>();
        return instance;
    }
};

template <> struct EncoderInstance<double> {
    static auto get() -> EncoderRef<double> {
        static const EncoderRef<double> instance = make_rc<const DoubleEncoder>();
        return instance;
    }
};

template <> struct EncoderInstance<float> {
    static auto get() -> EncoderRef<float> {
        static const EncoderRef<float> instance =
            contramap<float>(encoder<double>(), [](float f) { return static_cast<double>(f); });
        return instance;
    }
};

template <> struct EncoderInstance<std::string> {
    static auto get() -> EncoderRef<std::string> {
        static const EncoderRef<std::string> instance = make_rc<const StringEncoder>();
        return instance;
    }
};

template <> struct EncoderInstance<char> {
    static auto get() -> EncoderRef<char> {
        static const EncoderRef<char> instance =
            contramap<char>(encoder<std::string>(), [](char c) { return std::string(1, c); });
        return instance;
    }
};

template <> struct EncoderInstance<JsonValue> {
    static auto get() -> EncoderRef<JsonValue> {
        static const EncoderRef<JsonValue> instance = make_rc<const JsonValueEncoder>();
        return instance;
    }
};

template <typename A> struct EncoderInstance<std::optional<A>> {
    static auto get() -> EncoderRef<std::optional<A>> {
        static const EncoderRef<std::optional<A>> instance =
            make_rc<const OptionalEncoder<A>>(encoder<A>());
        return instance;
    }
};

/// Arrays for every sequence and set container.
template <typename C> struct SequenceEncoderInstance {
    static auto get() -> EncoderRef<C> {
        static const EncoderRef<C> instance =
            make_rc<const SequenceEncoder<C>>(encoder<typename C::value_type>());
        return instance;
    }
};

template <typename A>
struct EncoderInstance<std::vector<A>> : SequenceEncoderInstance<std::vector<A>> {};
template <typename A>
struct EncoderInstance<std::list<A>> : SequenceEncoderInstance<std::list<A>> {};
template <typename A>
struct EncoderInstance<std::deque<A>> : SequenceEncoderInstance<std::deque<A>> {};
template <typename A>
struct EncoderInstance<std::set<A>> : SequenceEncoderInstance<std::set<A>> {};
template <typename A>
struct EncoderInstance<std::unordered_set<A>> : SequenceEncoderInstance<std::unordered_set<A>> {};

/// Objects for maps.
template <typename C> struct KeyListEncoderInstance {
    static auto get() -> EncoderRef<C> {
        static const EncoderRef<C> instance =
            make_rc<const KeyListEncoder<C>>(encoder<typename C::mapped_type>());
        return instance;
    }
};

template <typename K, typename V>
struct EncoderInstance<std::map<K, V>> : KeyListEncoderInstance<std::map<K, V>> {};
template <typename K, typename V>
struct EncoderInstance<std::unordered_map<K, V>>
    : KeyListEncoderInstance<std::unordered_map<K, V>> {};

template <typename A, typename B> struct EncoderInstance<std::pair<A, B>> {
    static auto get() -> EncoderRef<std::pair<A, B>> {
        static const EncoderRef<std::pair<A, B>> instance =
            make_rc<const TupleEncoder<std::pair<A, B>, A, B>>();
        return instance;
    }
};

template <typename... Ts> struct EncoderInstance<std::tuple<Ts...>> {
    static auto get() -> EncoderRef<std::tuple<Ts...>> {
        static const EncoderRef<std::tuple<Ts...>> instance =
            make_rc<const TupleEncoder<std::tuple<Ts...>, Ts...>>();
        return instance;
    }
};

// ============================================================================
// Entry Points
// ============================================================================

/// Encodes `value` as compact JSON.
template <typename T> [[nodiscard]] auto to_json(const T& value) -> std::string {
    return encoder<T>()->encode(value);
}

/// Encodes `value` as pretty-printed JSON (indentation level 0).
template <typename T> [[nodiscard]] auto to_json_pretty(const T& value) -> std::string {
    return encoder<T>()->encode(value, 0);
}

/// Streams `value` to `os`.
template <typename T>
void write_json(const T& value, std::ostream& os, const Indent& indent = std::nullopt) {
    StreamWriter out(os);
    encoder<T>()->unsafe_encode(value, indent, out);
}

} // namespace jcodec::json
