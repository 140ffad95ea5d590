//! # JSON Decoders
//!
//! Pull-style text-to-value decoders. A `Decoder<T>` reads exactly one JSON
//! value from a `JsonReader` and returns either the `T` or a `DecodeError`
//! whose trace locates the failure.
//!
//! ## Error Traces
//!
//! Every decoder receives the trace of its own position. Containers extend
//! it before calling the decoders of their children:
//!
//! | Step | Rendered | Added by |
//! |------|----------|----------|
//! | Field | `.name` | products, maps |
//! | Index | `[i]` | sequences, tuples |
//! | Variant | `{Tag}` | sums |
//!
//! ```cpp
//! auto result = from_json<std::vector<int>>("[1, 2, \"x\"]");
//! unwrap_err(result).to_string();  // "[2](expected a number)"
//! ```
//!
//! ## Missing Fields
//!
//! When a product field is absent from the input, the field's decoder is
//! asked for `decode_missing`. The default fails with `"missing"`;
//! `std::optional` decodes to `std::nullopt` instead.

#pragma once

#include "common.hpp"
#include "json/json_codec.hpp"
#include "json/json_error.hpp"
#include "json/json_lexer.hpp"
#include "json/json_reader.hpp"
#include "json/json_value.hpp"
#include "log/log.hpp"

#include <charconv>
#include <cmath>
#include <deque>
#include <istream>
#include <limits>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace jcodec::json {

// ============================================================================
// Decoder
// ============================================================================

/// Pull decoder for values of type `T`.
template <typename T> class Decoder {
public:
    virtual ~Decoder() = default;

    /// Reads one value from `in`. Leading whitespace is skipped; trailing
    /// input is left for the caller.
    virtual auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<T, DecodeError> = 0;

    /// Produces a value for a product field that is absent from the input.
    virtual auto decode_missing(const DecodeTrace& trace) const -> Result<T, DecodeError> {
        return DecodeError::make("missing", trace);
    }

    /// Decodes a complete document. Anything but whitespace after the value
    /// is an error.
    [[nodiscard]] auto decode(std::string_view text) const -> Result<T, DecodeError> {
        StringReader in(text);
        return decode_all(in);
    }

    /// Decodes a complete document from `in`.
    [[nodiscard]] auto decode_all(JsonReader& in) const -> Result<T, DecodeError> {
        DecodeTrace trace;
        auto result = unsafe_decode(trace, in);
        if (is_err(result)) {
            return result;
        }
        auto end = lexer::expect_end(trace, in);
        if (is_err(end)) {
            return unwrap_err(end);
        }
        return result;
    }
};

/// Resolves the decoder instance for `T`.
///
/// The primary template handles user types through `JsonDerive<T>`.
template <typename T, typename Enable = void> struct DecoderInstance {
    static auto get() -> DecoderRef<T> {
        return JsonDerive<T>::codec().decoder;
    }
};

/// Returns the decoder for `T`.
template <typename T> [[nodiscard]] auto decoder() -> DecoderRef<T> {
    return DecoderInstance<T>::get();
}

// ============================================================================
// Combinators
// ============================================================================

/// Decoder for `B` that decodes an `A` and converts it.
template <typename B, typename A, typename F> class MappedDecoder final : public Decoder<B> {
public:
    MappedDecoder(DecoderRef<A> inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<B, DecodeError> override {
        return convert(inner_->unsafe_decode(trace, in));
    }

    auto decode_missing(const DecodeTrace& trace) const -> Result<B, DecodeError> override {
        return convert(inner_->decode_missing(trace));
    }

private:
    DecoderRef<A> inner_;
    F f_;

    auto convert(Result<A, DecodeError> decoded) const -> Result<B, DecodeError> {
        if (is_err(decoded)) {
            return unwrap_err(decoded);
        }
        return B(f_(std::move(unwrap(decoded))));
    }
};

/// Decoder for `B` that decodes an `A` and converts it with a function
/// that may reject the value with a message.
template <typename B, typename A, typename F> class MapOrFailDecoder final : public Decoder<B> {
public:
    MapOrFailDecoder(DecoderRef<A> inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<B, DecodeError> override {
        auto decoded = inner_->unsafe_decode(trace, in);
        if (is_err(decoded)) {
            return unwrap_err(decoded);
        }
        Result<B, std::string> converted = f_(std::move(unwrap(decoded)));
        if (is_err(converted)) {
            return DecodeError::make(std::move(unwrap_err(converted)), trace);
        }
        return std::move(unwrap(converted));
    }

private:
    DecoderRef<A> inner_;
    F f_;
};

/// Builds a decoder for `B` from a decoder for `A` and a function `A -> B`.
template <typename B, typename A, typename F>
[[nodiscard]] auto map(DecoderRef<A> inner, F f) -> DecoderRef<B> {
    return make_rc<const MappedDecoder<B, A, F>>(std::move(inner), std::move(f));
}

/// Invariant map: only the forward function `f: A -> B` is used by decoding.
template <typename B, typename A, typename F, typename G>
[[nodiscard]] auto xmap(DecoderRef<A> inner, F f, G /*g*/) -> DecoderRef<B> {
    return map<B>(std::move(inner), std::move(f));
}

/// Builds a decoder for `B` from a decoder for `A` and a function
/// `A -> Result<B, std::string>`. A rejected value fails at the position of
/// the value with the returned message.
///
/// # Example
///
/// ```cpp
/// auto port = map_or_fail<uint16_t>(decoder<int64_t>(), [](int64_t n) -> Result<uint16_t> {
///     if (n <= 0 || n > 65535) return std::string("not a port");
///     return static_cast<uint16_t>(n);
/// });
/// ```
template <typename B, typename A, typename F>
[[nodiscard]] auto map_or_fail(DecoderRef<A> inner, F f) -> DecoderRef<B> {
    return make_rc<const MapOrFailDecoder<B, A, F>>(std::move(inner), std::move(f));
}

// ============================================================================
// Object Keys
// ============================================================================

/// Converts object member names to map keys.
template <typename K, typename Enable = void> struct FieldDecoder;

template <> struct FieldDecoder<std::string> {
    static auto decode_field(std::string name) -> Result<std::string, std::string> {
        return Result<std::string, std::string>(std::in_place_index<0>, std::move(name));
    }
};

template <typename K>
struct FieldDecoder<K, std::enable_if_t<std::is_integral_v<K> && !std::is_same_v<K, bool>>> {
    static auto decode_field(const std::string& name) -> Result<K, std::string> {
        K key{};
        auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), key);
        if (ec != std::errc{} || ptr != name.data() + name.size()) {
            return Result<K, std::string>(std::in_place_index<1>, "invalid key");
        }
        return key;
    }
};

// ============================================================================
// Scalar Decoders
// ============================================================================

class BoolDecoder final : public Decoder<bool> {
public:
    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<bool, DecodeError> override {
        return lexer::boolean(trace, in);
    }
};

/// Integers must be written without fraction or exponent and fit in `T`.
template <typename T> class IntegralDecoder final : public Decoder<T> {
public:
    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<T, DecodeError> override {
        auto number = lexer::number(trace, in);
        if (is_err(number)) {
            return unwrap_err(number);
        }
        const JsonNumber& n = unwrap(number);
        if (n.is_float()) {
            return DecodeError::make("expected an integer", trace);
        }
        if constexpr (std::is_signed_v<T>) {
            auto value = n.try_as_i64();
            if (!value || *value < std::numeric_limits<T>::min() ||
                *value > std::numeric_limits<T>::max()) {
                return DecodeError::make("out of range", trace);
            }
            return static_cast<T>(*value);
        } else {
            auto value = n.try_as_u64();
            if (!value || *value > std::numeric_limits<T>::max()) {
                return DecodeError::make("out of range", trace);
            }
            return static_cast<T>(*value);
        }
    }
};

/// Accepts numbers and the strings `"NaN"`, `"Infinity"` and `"-Infinity"`.
class DoubleDecoder final : public Decoder<double> {
public:
    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<double, DecodeError> override;
};

class StringDecoder final : public Decoder<std::string> {
public:
    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<std::string, DecodeError> override {
        return lexer::string(trace, in);
    }
};

/// Any JSON value. Member order and duplicate keys are preserved.
class JsonValueDecoder final : public Decoder<JsonValue> {
public:
    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<JsonValue, DecodeError> override;
};

// ============================================================================
// Container Decoders
// ============================================================================

/// `null` and an absent field both decode to `std::nullopt`.
template <typename A> class OptionalDecoder final : public Decoder<std::optional<A>> {
public:
    explicit OptionalDecoder(DecoderRef<A> inner) : inner_(std::move(inner)) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<std::optional<A>, DecodeError> override {
        if (lexer::peek(in) == 'n') {
            auto null = lexer::null_literal(trace, in);
            if (is_err(null)) {
                return unwrap_err(null);
            }
            return std::optional<A>();
        }
        auto value = inner_->unsafe_decode(trace, in);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return std::optional<A>(std::move(unwrap(value)));
    }

    auto decode_missing(const DecodeTrace& /*trace*/) const
        -> Result<std::optional<A>, DecodeError> override {
        return std::optional<A>();
    }

private:
    DecoderRef<A> inner_;
};

/// Arrays into any container with `insert(end(), value)`.
template <typename C> class SequenceDecoder final : public Decoder<C> {
public:
    using Element = typename C::value_type;

    explicit SequenceDecoder(DecoderRef<Element> inner) : inner_(std::move(inner)) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<C, DecodeError> override {
        auto open = lexer::expect_char(trace, in, '[');
        if (is_err(open)) {
            return unwrap_err(open);
        }

        C values;
        size_t index = 0;
        auto more = lexer::first_array(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return values;
            }
            auto value = inner_->unsafe_decode(trace.with_index(index), in);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            values.insert(values.end(), std::move(unwrap(value)));
            ++index;
            more = lexer::next_array(trace, in);
        }
    }

private:
    DecoderRef<Element> inner_;
};

/// Objects into maps. A repeated key keeps its last value.
template <typename C> class KeyMapDecoder final : public Decoder<C> {
public:
    using Key = typename C::key_type;
    using Value = typename C::mapped_type;

    explicit KeyMapDecoder(DecoderRef<Value> inner) : inner_(std::move(inner)) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<C, DecodeError> override {
        auto open = lexer::expect_char(trace, in, '{');
        if (is_err(open)) {
            return unwrap_err(open);
        }

        C values;
        auto more = lexer::first_object(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return values;
            }
            auto name = lexer::field_name(trace, in);
            if (is_err(name)) {
                return unwrap_err(name);
            }
            DecodeTrace member_trace = trace.with_field(unwrap(name));
            auto key = FieldDecoder<Key>::decode_field(std::move(unwrap(name)));
            if (is_err(key)) {
                return DecodeError::make(std::move(unwrap_err(key)), member_trace);
            }
            auto value = inner_->unsafe_decode(member_trace, in);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            values.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));
            more = lexer::next_object(trace, in);
        }
    }

private:
    DecoderRef<Value> inner_;
};

/// Fixed-length arrays into `std::pair` and `std::tuple`.
template <typename P, typename... Ts> class TupleDecoder final : public Decoder<P> {
public:
    TupleDecoder() : inner_(decoder<Ts>()...) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<P, DecodeError> override {
        auto open = lexer::expect_char(trace, in, '[');
        if (is_err(open)) {
            return unwrap_err(open);
        }

        std::tuple<std::optional<Ts>...> parts;
        std::optional<DecodeError> error;
        decode_elements(trace, in, parts, error, std::index_sequence_for<Ts...>{});
        if (error) {
            return std::move(*error);
        }

        auto close = lexer::expect_char(trace, in, ']');
        if (is_err(close)) {
            return unwrap_err(close);
        }
        return assemble(parts, std::index_sequence_for<Ts...>{});
    }

private:
    std::tuple<DecoderRef<Ts>...> inner_;

    template <size_t... Is>
    void decode_elements(const DecodeTrace& trace, JsonReader& in,
                         std::tuple<std::optional<Ts>...>& parts, std::optional<DecodeError>& error,
                         std::index_sequence<Is...> /*indices*/) const {
        (decode_element<Is>(trace, in, parts, error), ...);
    }

    template <size_t I>
    void decode_element(const DecodeTrace& trace, JsonReader& in,
                        std::tuple<std::optional<Ts>...>& parts,
                        std::optional<DecodeError>& error) const {
        if (error) {
            return;
        }
        if constexpr (I > 0) {
            auto comma = lexer::expect_char(trace, in, ',');
            if (is_err(comma)) {
                error = unwrap_err(comma);
                return;
            }
        }
        auto value = std::get<I>(inner_)->unsafe_decode(trace.with_index(I), in);
        if (is_err(value)) {
            error = unwrap_err(value);
            return;
        }
        std::get<I>(parts) = std::move(unwrap(value));
    }

    template <size_t... Is>
    auto assemble(std::tuple<std::optional<Ts>...>& parts,
                  std::index_sequence<Is...> /*indices*/) const -> P {
        return P(std::move(*std::get<Is>(parts))...);
    }
};

// ============================================================================
// Instances
// ============================================================================

namespace detail {

template <typename T> struct is_decodable_integral
    : std::bool_constant<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                         !std::is_same_v<T, char>> {};

} // namespace detail

template <> struct DecoderInstance<bool> {
    static auto get() -> DecoderRef<bool> {
        static const DecoderRef<bool> instance = make_rc<const BoolDecoder>();
        return instance;
    }
};

template <typename T>
struct DecoderInstance<T, std::enable_if_t<detail::is_decodable_integral<T>::value>> {
    static auto get() -> DecoderRef<T> {
        static const DecoderRef<T> instance = make_rc<const IntegralDecoder<T>>();
        return instance;
    }
};

template <> struct DecoderInstance<double> {
    static auto get() -> DecoderRef<double> {
        static const DecoderRef<double> instance = make_rc<const DoubleDecoder>();
        return instance;
    }
};

template <> struct DecoderInstance<float> {
    static auto get() -> DecoderRef<float> {
        static const DecoderRef<float> instance =
            map<float>(decoder<double>(), [](double d) { return static_cast<float>(d); });
        return instance;
    }
};

template <> struct DecoderInstance<std::string> {
    static auto get() -> DecoderRef<std::string> {
        static const DecoderRef<std::string> instance = make_rc<const StringDecoder>();
        return instance;
    }
};

template <> struct DecoderInstance<char> {
    static auto get() -> DecoderRef<char> {
        static const DecoderRef<char> instance =
            map_or_fail<char>(decoder<std::string>(), [](std::string s) -> Result<char> {
                if (s.size() != 1) {
                    return Result<char>(std::in_place_index<1>, "expected one character");
                }
                return s[0];
            });
        return instance;
    }
};

template <> struct DecoderInstance<JsonValue> {
    static auto get() -> DecoderRef<JsonValue> {
        static const DecoderRef<JsonValue> instance = make_rc<const JsonValueDecoder>();
        return instance;
    }
};

template <typename A> struct DecoderInstance<std::optional<A>> {
    static auto get() -> DecoderRef<std::optional<A>> {
        static const DecoderRef<std::optional<A>> instance =
            make_rc<const OptionalDecoder<A>>(decoder<A>());
        return instance;
    }
};

template <typename C> struct SequenceDecoderInstance {
    static auto get() -> DecoderRef<C> {
        static const DecoderRef<C> instance =
            make_rc<const SequenceDecoder<C>>(decoder<typename C::value_type>());
        return instance;
    }
};

template <typename A>
struct DecoderInstance<std::vector<A>> : SequenceDecoderInstance<std::vector<A>> {};
template <typename A>
struct DecoderInstance<std::list<A>> : SequenceDecoderInstance<std::list<A>> {};
template <typename A>
struct DecoderInstance<std::deque<A>> : SequenceDecoderInstance<std::deque<A>> {};
template <typename A>
struct DecoderInstance<std::set<A>> : SequenceDecoderInstance<std::set<A>> {};
template <typename A>
struct DecoderInstance<std::unordered_set<A>> : SequenceDecoderInstance<std::unordered_set<A>> {};

template <typename C> struct MapDecoderInstance {
    static auto get() -> DecoderRef<C> {
        static const DecoderRef<C> instance =
            make_rc<const KeyMapDecoder<C>>(decoder<typename C::mapped_type>());
        return instance;
    }
};

template <typename K, typename V>
struct DecoderInstance<std::map<K, V>> : MapDecoderInstance<std::map<K, V>> {};
template <typename K, typename V>
struct DecoderInstance<std::unordered_map<K, V>> : MapDecoderInstance<std::unordered_map<K, V>> {};

template <typename A, typename B> struct DecoderInstance<std::pair<A, B>> {
    static auto get() -> DecoderRef<std::pair<A, B>> {
        static const DecoderRef<std::pair<A, B>> instance =
            make_rc<const TupleDecoder<std::pair<A, B>, A, B>>();
        return instance;
    }
};

template <typename... Ts> struct DecoderInstance<std::tuple<Ts...>> {
    static auto get() -> DecoderRef<std::tuple<Ts...>> {
        static const DecoderRef<std::tuple<Ts...>> instance =
            make_rc<const TupleDecoder<std::tuple<Ts...>, Ts...>>();
        return instance;
    }
};

// ============================================================================
// Entry Points
// ============================================================================

/// Parses JSON text into a `JsonValue`.
[[nodiscard]] auto parse_json(std::string_view text) -> Result<JsonValue, DecodeError>;

/// Decodes a complete JSON document into a `T`.
///
/// # Example
///
/// ```cpp
/// auto result = from_json<std::map<std::string, int>>(R"({"a": 1, "b": 2})");
/// if (is_ok(result)) {
///     auto& counts = unwrap(result);
/// }
/// ```
template <typename T> [[nodiscard]] auto from_json(std::string_view text) -> Result<T, DecodeError> {
    auto result = decoder<T>()->decode(text);
    if (is_err(result)) {
        JCODEC_LOG_DEBUG("json", "decode failed: " << unwrap_err(result).to_string());
    }
    return result;
}

/// Decodes a complete JSON document from a stream into a `T`.
template <typename T> [[nodiscard]] auto read_json(std::istream& is) -> Result<T, DecodeError> {
    StreamReader in(is);
    auto result = decoder<T>()->decode_all(in);
    if (is_err(result)) {
        JCODEC_LOG_DEBUG("json", "decode failed: " << unwrap_err(result).to_string());
    }
    return result;
}

} // namespace jcodec::json
