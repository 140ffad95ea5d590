//! # Codec Derivation
//!
//! Builders that turn the shape of a user type into a `Codec<T>`.
//!
//! ## Products
//!
//! A product is a struct encoded as a JSON object, one member per field, in
//! declaration order:
//!
//! ```cpp
//! struct Point {
//!     double x;
//!     double y;
//!     std::optional<std::string> label;
//! };
//!
//! auto codec = derive::product<Point>()
//!                  .field("x", &Point::x)
//!                  .field("y", &Point::y)
//!                  .field("label", &Point::label, "name")
//!                  .build();
//! ```
//!
//! Fields whose encoder reports `is_nothing` (an empty `std::optional`) are
//! left out. Decoding matches members by name in any order, rejects a field
//! seen twice with `"duplicate"`, skips unknown members (or rejects them
//! with `"invalid extra field"` after `no_extra_fields()`), and fills absent
//! fields from `Decoder::decode_missing`. The decoded type must be default
//! constructible.
//!
//! ## Sums
//!
//! A sum is a `std::variant` of products. Without a discriminator each value
//! is wrapped in a single-member object keyed by its tag:
//!
//! ```text
//! {"Circle":{"radius":1.0}}
//! ```
//!
//! With `discriminator("type")` the tag is merged into the variant's own
//! object instead:
//!
//! ```text
//! {"type":"Circle","radius":1.0}
//! ```
//!
//! The encoder writes the tag member and splices the variant's members in
//! through a `NestedObjectWriter`. The decoder records the object while it
//! looks for the tag, then rewinds and decodes the whole object again with
//! the selected variant's decoder.
//!
//! ## Recursion
//!
//! Field and variant codecs are looked up when first used, not when the
//! codec is built, so a type may contain containers of itself.

#pragma once

#include "common.hpp"
#include "json/json_codec.hpp"
#include "json/json_decoder.hpp"
#include "json/json_encoder.hpp"
#include "json/json_lexer.hpp"
#include "json/json_reader.hpp"
#include "json/json_writer.hpp"
#include "log/log.hpp"

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace jcodec::json::derive {

// ============================================================================
// Product Fields
// ============================================================================

namespace detail {

/// One field of a product, with its member type erased.
template <typename T> class FieldSpec {
public:
    explicit FieldSpec(std::string name) : name_(std::move(name)) {}
    virtual ~FieldSpec() = default;

    /// The member name used on the wire.
    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] virtual auto is_nothing(const T& value) const -> bool = 0;

    virtual void encode(const T& value, const Indent& indent, JsonWriter& out) const = 0;

    virtual auto decode_into(T& value, const DecodeTrace& trace, JsonReader& in) const
        -> Result<Unit, DecodeError> = 0;

    virtual auto decode_missing_into(T& value, const DecodeTrace& trace) const
        -> Result<Unit, DecodeError> = 0;

private:
    std::string name_;
};

/// A field stored in the data member `member`.
///
/// Without an explicit codec the field's encoder and decoder are resolved
/// on every use through `encoder<F>()` and `decoder<F>()`.
template <typename T, typename F> class MemberField final : public FieldSpec<T> {
public:
    MemberField(std::string name, F T::*member, std::optional<Codec<F>> codec)
        : FieldSpec<T>(std::move(name)), member_(member), codec_(std::move(codec)) {}

    auto is_nothing(const T& value) const -> bool override {
        return field_encoder()->is_nothing(value.*member_);
    }

    void encode(const T& value, const Indent& indent, JsonWriter& out) const override {
        field_encoder()->unsafe_encode(value.*member_, indent, out);
    }

    auto decode_into(T& value, const DecodeTrace& trace, JsonReader& in) const
        -> Result<Unit, DecodeError> override {
        return assign(value, field_decoder()->unsafe_decode(trace, in));
    }

    auto decode_missing_into(T& value, const DecodeTrace& trace) const
        -> Result<Unit, DecodeError> override {
        return assign(value, field_decoder()->decode_missing(trace));
    }

private:
    F T::*member_;
    std::optional<Codec<F>> codec_;

    [[nodiscard]] auto field_encoder() const -> EncoderRef<F> {
        return codec_ ? codec_->encoder : encoder<F>();
    }

    [[nodiscard]] auto field_decoder() const -> DecoderRef<F> {
        return codec_ ? codec_->decoder : decoder<F>();
    }

    auto assign(T& value, Result<F, DecodeError> decoded) const -> Result<Unit, DecodeError> {
        if (is_err(decoded)) {
            return std::move(unwrap_err(decoded));
        }
        value.*member_ = std::move(unwrap(decoded));
        return Unit{};
    }
};

template <typename T> using FieldList = std::vector<Rc<const FieldSpec<T>>>;

} // namespace detail

// ============================================================================
// Product Codecs
// ============================================================================

template <typename T> class ProductEncoder final : public Encoder<T> {
public:
    explicit ProductEncoder(detail::FieldList<T> fields) : fields_(std::move(fields)) {}

    void unsafe_encode(const T& value, const Indent& indent, JsonWriter& out) const override {
        out.write('{');
        Indent inner = bump(indent);
        bool first = true;
        for (const auto& field : fields_) {
            if (field->is_nothing(value)) {
                continue;
            }
            if (first) {
                first = false;
            } else {
                out.write(',');
            }
            pad(inner, out);
            write_escaped(field->name(), out);
            write_colon(indent, out);
            field->encode(value, inner, out);
        }
        if (!first) {
            pad(indent, out);
        }
        out.write('}');
    }

private:
    detail::FieldList<T> fields_;
};

template <typename T> class ProductDecoder final : public Decoder<T> {
public:
    ProductDecoder(detail::FieldList<T> fields, bool no_extra)
        : fields_(std::move(fields)), matcher_(names(fields_)), no_extra_(no_extra) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<T, DecodeError> override {
        if (fields_.empty()) {
            return decode_empty(trace, in);
        }

        auto open = lexer::expect_char(trace, in, '{');
        if (is_err(open)) {
            return unwrap_err(open);
        }

        T value{};
        std::vector<bool> seen(fields_.size(), false);
        auto more = lexer::first_object(trace, in);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                break;
            }

            auto index = lexer::field(trace, in, matcher_);
            if (is_err(index)) {
                return unwrap_err(index);
            }
            int i = unwrap(index);
            if (i >= 0) {
                const auto& field = fields_[static_cast<size_t>(i)];
                DecodeTrace field_trace = trace.with_field(field->name());
                if (seen[static_cast<size_t>(i)]) {
                    return DecodeError::make("duplicate", field_trace);
                }
                seen[static_cast<size_t>(i)] = true;
                auto decoded = field->decode_into(value, field_trace, in);
                if (is_err(decoded)) {
                    return unwrap_err(decoded);
                }
            } else if (no_extra_) {
                return DecodeError::make("invalid extra field", trace);
            } else {
                auto skipped = lexer::skip_value(trace, in);
                if (is_err(skipped)) {
                    return unwrap_err(skipped);
                }
            }
            more = lexer::next_object(trace, in);
        }

        for (size_t i = 0; i < fields_.size(); ++i) {
            if (seen[i]) {
                continue;
            }
            auto filled =
                fields_[i]->decode_missing_into(value, trace.with_field(fields_[i]->name()));
            if (is_err(filled)) {
                return unwrap_err(filled);
            }
        }
        return value;
    }

private:
    detail::FieldList<T> fields_;
    FieldMatcher matcher_;
    bool no_extra_;

    static auto names(const detail::FieldList<T>& fields) -> FieldMatcher {
        std::vector<std::string> result;
        result.reserve(fields.size());
        for (const auto& field : fields) {
            result.push_back(field->name());
        }
        return FieldMatcher(std::move(result));
    }

    /// A product without fields accepts any value, or only `{}` when extra
    /// fields are rejected.
    auto decode_empty(const DecodeTrace& trace, JsonReader& in) const -> Result<T, DecodeError> {
        if (no_extra_) {
            auto open = lexer::expect_char(trace, in, '{');
            if (is_err(open)) {
                return unwrap_err(open);
            }
            auto close = lexer::expect_char(trace, in, '}');
            if (is_err(close)) {
                return unwrap_err(close);
            }
        } else {
            auto skipped = lexer::skip_value(trace, in);
            if (is_err(skipped)) {
                return unwrap_err(skipped);
            }
        }
        return T{};
    }
};

// ============================================================================
// Product Builder
// ============================================================================

/// Collects the fields of a product type.
///
/// # Panics
///
/// `field` throws `std::logic_error` when two fields share a wire name.
template <typename T> class ProductBuilder {
public:
    /// Adds the data member `member` under `label`, or under `rename` when
    /// it is given.
    template <typename F>
    auto field(std::string label, F T::*member, std::string rename = {}) -> ProductBuilder& {
        return add<F>(std::move(label), member, std::nullopt, std::move(rename));
    }

    /// Adds a field with an explicit codec instead of the instance for `F`.
    template <typename F>
    auto field_with(std::string label, F T::*member, Codec<F> codec, std::string rename = {})
        -> ProductBuilder& {
        return add<F>(std::move(label), member, std::move(codec), std::move(rename));
    }

    /// Makes unknown members a decode error.
    auto no_extra_fields() -> ProductBuilder& {
        no_extra_ = true;
        return *this;
    }

    [[nodiscard]] auto build() const -> Codec<T> {
        JCODEC_LOG_DEBUG("derive", "product codec with " << fields_.size() << " field(s)"
                                                         << (no_extra_ ? ", no extra fields" : ""));
        return Codec<T>{make_rc<const ProductEncoder<T>>(fields_),
                        make_rc<const ProductDecoder<T>>(fields_, no_extra_)};
    }

private:
    detail::FieldList<T> fields_;
    std::unordered_set<std::string> names_;
    bool no_extra_ = false;

    template <typename F>
    auto add(std::string label, F T::*member, std::optional<Codec<F>> codec, std::string rename)
        -> ProductBuilder& {
        std::string name = rename.empty() ? std::move(label) : std::move(rename);
        if (!names_.insert(name).second) {
            throw std::logic_error("duplicate field name '" + name + "'");
        }
        fields_.push_back(
            make_rc<const detail::MemberField<T, F>>(std::move(name), member, std::move(codec)));
        return *this;
    }
};

/// Starts a product derivation for `T`.
template <typename T> [[nodiscard]] auto product() -> ProductBuilder<T> {
    return ProductBuilder<T>();
}

// ============================================================================
// Sum Codecs
// ============================================================================

template <typename V> class SumEncoder;

template <typename... Ts> class SumEncoder<std::variant<Ts...>> final
    : public Encoder<std::variant<Ts...>> {
public:
    using Value = std::variant<Ts...>;

    SumEncoder(std::vector<std::string> names, std::optional<std::string> discriminator)
        : names_(std::move(names)), discriminator_(std::move(discriminator)) {}

    void unsafe_encode(const Value& value, const Indent& indent, JsonWriter& out) const override {
        const std::string& name = names_[value.index()];
        std::visit(
            [&](const auto& alternative) {
                using A = std::decay_t<decltype(alternative)>;
                Indent inner = bump(indent);
                out.write('{');
                pad(inner, out);
                if (discriminator_) {
                    write_escaped(*discriminator_, out);
                    write_colon(indent, out);
                    write_escaped(name, out);
                    NestedObjectWriter nested(out, inner);
                    encoder<A>()->unsafe_encode(alternative, indent, nested);
                } else {
                    write_escaped(name, out);
                    write_colon(indent, out);
                    encoder<A>()->unsafe_encode(alternative, inner, out);
                    pad(indent, out);
                    out.write('}');
                }
            },
            value);
    }

private:
    std::vector<std::string> names_;
    std::optional<std::string> discriminator_;
};

namespace detail {

/// Decodes alternative `I` of `V` and wraps it.
template <typename V, size_t I>
auto decode_alternative(const DecodeTrace& trace, JsonReader& in) -> Result<V, DecodeError> {
    using A = std::variant_alternative_t<I, V>;
    auto decoded = decoder<A>()->unsafe_decode(trace, in);
    if (is_err(decoded)) {
        return std::move(unwrap_err(decoded));
    }
    return V(std::in_place_index<I>, std::move(unwrap(decoded)));
}

template <typename V>
using AlternativeDecoder = auto (*)(const DecodeTrace&, JsonReader&) -> Result<V, DecodeError>;

template <typename V, size_t... Is>
auto alternative_decoders(std::index_sequence<Is...> /*indices*/)
    -> std::vector<AlternativeDecoder<V>> {
    return {&decode_alternative<V, Is>...};
}

} // namespace detail

/// Decodes `{"Tag": value}`.
template <typename V> class SumDecoder;

template <typename... Ts> class SumDecoder<std::variant<Ts...>> final
    : public Decoder<std::variant<Ts...>> {
public:
    using Value = std::variant<Ts...>;

    explicit SumDecoder(std::vector<std::string> names)
        : matcher_(std::move(names)),
          decoders_(detail::alternative_decoders<Value>(std::index_sequence_for<Ts...>{})) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<Value, DecodeError> override {
        auto open = lexer::expect_char(trace, in, '{');
        if (is_err(open)) {
            return unwrap_err(open);
        }
        auto more = lexer::first_object(trace, in);
        if (is_err(more)) {
            return unwrap_err(more);
        }
        if (!unwrap(more)) {
            return DecodeError::make("expected non-empty object", trace);
        }

        auto index = lexer::field(trace, in, matcher_);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        int i = unwrap(index);
        if (i < 0) {
            return DecodeError::make("invalid disambiguator", trace);
        }

        auto value = decoders_[static_cast<size_t>(i)](
            trace.with_field(matcher_.name(static_cast<size_t>(i))), in);
        if (is_err(value)) {
            return value;
        }
        auto close = lexer::expect_char(trace, in, '}');
        if (is_err(close)) {
            return unwrap_err(close);
        }
        return value;
    }

private:
    FieldMatcher matcher_;
    std::vector<detail::AlternativeDecoder<Value>> decoders_;
};

/// Decodes `{"<discriminator>": "Tag", ...}` with the tag anywhere in the
/// object.
template <typename V> class DiscriminatedSumDecoder;

template <typename... Ts> class DiscriminatedSumDecoder<std::variant<Ts...>> final
    : public Decoder<std::variant<Ts...>> {
public:
    using Value = std::variant<Ts...>;

    DiscriminatedSumDecoder(std::vector<std::string> names, std::string discriminator)
        : matcher_(std::move(names)), hint_(std::vector<std::string>{discriminator}),
          discriminator_(std::move(discriminator)),
          decoders_(detail::alternative_decoders<Value>(std::index_sequence_for<Ts...>{})) {}

    auto unsafe_decode(const DecodeTrace& trace, JsonReader& in) const
        -> Result<Value, DecodeError> override {
        RecordingReader recording(in);
        auto open = lexer::expect_char(trace, recording, '{');
        if (is_err(open)) {
            return unwrap_err(open);
        }

        auto more = lexer::first_object(trace, recording);
        while (true) {
            if (is_err(more)) {
                return unwrap_err(more);
            }
            if (!unwrap(more)) {
                return DecodeError::make("missing hint '" + discriminator_ + "'", trace);
            }

            auto hint = lexer::field(trace, recording, hint_);
            if (is_err(hint)) {
                return unwrap_err(hint);
            }
            if (unwrap(hint) >= 0) {
                auto tag = lexer::enumeration(trace, recording, matcher_);
                if (is_err(tag)) {
                    return unwrap_err(tag);
                }
                int i = unwrap(tag);
                if (i < 0) {
                    return DecodeError::make("invalid disambiguator", trace);
                }
                const std::string& name = matcher_.name(static_cast<size_t>(i));
                JCODEC_LOG_TRACE("derive", "replaying object as '" << name << "'");
                recording.rewind();
                return decoders_[static_cast<size_t>(i)](trace.with_variant(name), recording);
            }

            auto skipped = lexer::skip_value(trace, recording);
            if (is_err(skipped)) {
                return unwrap_err(skipped);
            }
            more = lexer::next_object(trace, recording);
        }
    }

private:
    FieldMatcher matcher_;
    FieldMatcher hint_;
    std::string discriminator_;
    std::vector<detail::AlternativeDecoder<Value>> decoders_;
};

// ============================================================================
// Sum Builder
// ============================================================================

namespace detail {

template <typename A, typename... Ts> constexpr auto alternative_index() -> size_t {
    constexpr std::array<bool, sizeof...(Ts)> matches = {std::is_same_v<A, Ts>...};
    for (size_t i = 0; i < matches.size(); ++i) {
        if (matches[i]) {
            return i;
        }
    }
    return sizeof...(Ts);
}

} // namespace detail

/// Collects the variant names of a sum type.
template <typename V> class SumBuilder;

template <typename... Ts> class SumBuilder<std::variant<Ts...>> {
public:
    using Value = std::variant<Ts...>;

    /// Registers alternative `A` under `tag`, or under `hint` when it is
    /// given.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if `A` is already registered.
    template <typename A> auto variant(std::string tag, std::string hint = {}) -> SumBuilder& {
        constexpr size_t index = detail::alternative_index<A, Ts...>();
        static_assert(index < sizeof...(Ts), "type is not an alternative of the variant");
        if (names_[index]) {
            throw std::logic_error("variant '" + tag + "' registered twice");
        }
        names_[index] = hint.empty() ? std::move(tag) : std::move(hint);
        return *this;
    }

    /// Merges the tag into the variant's object under `field`.
    auto discriminator(std::string field) -> SumBuilder& {
        discriminator_ = std::move(field);
        return *this;
    }

    /// # Panics
    ///
    /// Throws `std::logic_error` if an alternative has no name or two
    /// alternatives share one.
    [[nodiscard]] auto build() const -> Codec<Value> {
        std::vector<std::string> names;
        std::unordered_set<std::string> unique;
        for (size_t i = 0; i < names_.size(); ++i) {
            if (!names_[i]) {
                throw std::logic_error("sum derivation is missing alternative " +
                                       std::to_string(i));
            }
            if (!unique.insert(*names_[i]).second) {
                throw std::logic_error("duplicate variant name '" + *names_[i] + "'");
            }
            names.push_back(*names_[i]);
        }

        JCODEC_LOG_DEBUG("derive", "sum codec with " << names.size() << " variant(s)"
                                                     << (discriminator_
                                                             ? ", discriminator '" +
                                                                   *discriminator_ + "'"
                                                             : std::string()));
        auto enc = make_rc<const SumEncoder<Value>>(names, discriminator_);
        if (discriminator_) {
            return Codec<Value>{
                enc,
                make_rc<const DiscriminatedSumDecoder<Value>>(std::move(names), *discriminator_)};
        }
        return Codec<Value>{enc, make_rc<const SumDecoder<Value>>(std::move(names))};
    }

private:
    std::array<std::optional<std::string>, sizeof...(Ts)> names_;
    std::optional<std::string> discriminator_;
};

/// Starts a sum derivation for the variant type `V`.
template <typename V> [[nodiscard]] auto sum() -> SumBuilder<V> {
    return SumBuilder<V>();
}

} // namespace jcodec::json::derive
