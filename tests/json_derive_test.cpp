//! # Derivation Tests
//!
//! Product and sum codecs built with `derive::product` and `derive::sum`:
//! field order and renaming, the nothing-hook, duplicate and extra fields,
//! missing-field fallbacks, wrapped and discriminated sums, replay of
//! discriminated objects, error traces and builder misuse.

#include "common.hpp"

#include "json/json.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace jcodec;
using namespace jcodec::json;

namespace {

struct User {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> email;
    std::vector<std::string> tags;
};

struct Strict {
    int a = 0;
};

struct Tree {
    int value = 0;
    std::vector<Tree> children;
};

struct Circle {
    double radius = 0;
};

struct Rect {
    double w = 0;
    double h = 0;
    std::optional<std::string> label;
};

struct Dot {};

using Shape = std::variant<Circle, Rect, Dot>;

struct Move {
    int dx = 0;
    int dy = 0;
};

struct Stop {};

using Command = std::variant<Move, Stop>;

struct Reading {
    int code = 0;
};

} // namespace

namespace jcodec::json {

template <> struct JsonDerive<User> {
    static auto codec() -> const Codec<User>& {
        static const auto c = derive::product<User>()
                                  .field("id", &User::id)
                                  .field("name", &User::name, "login")
                                  .field("email", &User::email)
                                  .field("tags", &User::tags)
                                  .build();
        return c;
    }
};

template <> struct JsonDerive<Strict> {
    static auto codec() -> const Codec<Strict>& {
        static const auto c = derive::product<Strict>().field("a", &Strict::a).no_extra_fields().build();
        return c;
    }
};

template <> struct JsonDerive<Tree> {
    static auto codec() -> const Codec<Tree>& {
        static const auto c = derive::product<Tree>()
                                  .field("value", &Tree::value)
                                  .field("children", &Tree::children)
                                  .build();
        return c;
    }
};

template <> struct JsonDerive<Circle> {
    static auto codec() -> const Codec<Circle>& {
        static const auto c = derive::product<Circle>().field("radius", &Circle::radius).build();
        return c;
    }
};

template <> struct JsonDerive<Rect> {
    static auto codec() -> const Codec<Rect>& {
        static const auto c = derive::product<Rect>()
                                  .field("w", &Rect::w)
                                  .field("h", &Rect::h)
                                  .field("label", &Rect::label)
                                  .build();
        return c;
    }
};

template <> struct JsonDerive<Dot> {
    static auto codec() -> const Codec<Dot>& {
        static const auto c = derive::product<Dot>().build();
        return c;
    }
};

template <> struct JsonDerive<Shape> {
    static auto codec() -> const Codec<Shape>& {
        static const auto c = derive::sum<Shape>()
                                  .variant<Circle>("Circle")
                                  .variant<Rect>("Rect", "rectangle")
                                  .variant<Dot>("Dot")
                                  .discriminator("type")
                                  .build();
        return c;
    }
};

template <> struct JsonDerive<Move> {
    static auto codec() -> const Codec<Move>& {
        static const auto c =
            derive::product<Move>().field("dx", &Move::dx).field("dy", &Move::dy).build();
        return c;
    }
};

template <> struct JsonDerive<Stop> {
    static auto codec() -> const Codec<Stop>& {
        static const auto c = derive::product<Stop>().no_extra_fields().build();
        return c;
    }
};

template <> struct JsonDerive<Command> {
    static auto codec() -> const Codec<Command>& {
        static const auto c =
            derive::sum<Command>().variant<Move>("Move").variant<Stop>("Stop").build();
        return c;
    }
};

} // namespace jcodec::json

namespace {

template <typename T> auto decode_ok(std::string_view text) -> T {
    auto result = from_json<T>(text);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
    return is_ok(result) ? unwrap(result) : T{};
}

template <typename T> auto decode_err(std::string_view text) -> std::string {
    auto result = from_json<T>(text);
    EXPECT_TRUE(is_err(result)) << "decoded: " << text;
    return is_err(result) ? unwrap_err(result).to_string() : std::string();
}

} // namespace

// ============================================================================
// Product Encoding
// ============================================================================

TEST(DeriveProductTest, EncodesFieldsInOrder) {
    User user{7, "ada", "ada@example.com", {"admin"}};
    EXPECT_EQ(to_json(user),
              R"({"id":7,"login":"ada","email":"ada@example.com","tags":["admin"]})");
}

TEST(DeriveProductTest, SkipsNothingFields) {
    User user{1, "bob", std::nullopt, {}};
    EXPECT_EQ(to_json(user), R"({"id":1,"login":"bob","tags":[]})");

    Rect rect{1.0, 2.0, std::nullopt};
    EXPECT_EQ(to_json(rect), R"({"w":1.0,"h":2.0})");
}

TEST(DeriveProductTest, PrettyLayout) {
    User user{1, "bob", std::nullopt, {"a", "b"}};
    EXPECT_EQ(to_json_pretty(user), "{\n"
                                    "  \"id\" : 1,\n"
                                    "  \"login\" : \"bob\",\n"
                                    "  \"tags\" : [\"a\", \"b\"]\n"
                                    "}");
}

TEST(DeriveProductTest, EmptyProductIsBraces) {
    EXPECT_EQ(to_json(Dot{}), "{}");
    EXPECT_EQ(to_json_pretty(Dot{}), "{}");
}

TEST(DeriveProductTest, RecursiveTypes) {
    Tree tree{1, {Tree{2, {}}, Tree{3, {Tree{4, {}}}}}};
    std::string text = to_json(tree);
    EXPECT_EQ(text,
              R"({"value":1,"children":[{"value":2,"children":[]},{"value":3,"children":[{"value":4,"children":[]}]}]})");

    auto decoded = decode_ok<Tree>(text);
    ASSERT_EQ(decoded.children.size(), 2u);
    EXPECT_EQ(decoded.children[1].children[0].value, 4);
}

// ============================================================================
// Product Decoding
// ============================================================================

TEST(DeriveProductTest, DecodesInAnyOrder) {
    auto user = decode_ok<User>(R"({"tags": ["x"], "login": "ada", "id": 3})");
    EXPECT_EQ(user.id, 3);
    EXPECT_EQ(user.name, "ada");
    EXPECT_FALSE(user.email.has_value());
    EXPECT_EQ(user.tags, std::vector<std::string>{"x"});
}

TEST(DeriveProductTest, SkipsUnknownFields) {
    auto user = decode_ok<User>(
        R"({"id": 3, "extra": {"deep": [1, {"x": null}]}, "login": "a", "tags": []})");
    EXPECT_EQ(user.id, 3);
}

TEST(DeriveProductTest, RejectsDuplicateFields) {
    EXPECT_EQ(decode_err<User>(R"({"id": 1, "id": 2, "login": "a", "tags": []})"),
              ".id(duplicate)");
}

TEST(DeriveProductTest, RejectsExtraFieldsWhenStrict) {
    EXPECT_EQ(decode_ok<Strict>(R"({"a": 5})").a, 5);
    EXPECT_EQ(decode_err<Strict>(R"({"a": 5, "b": 6})"), "(invalid extra field)");
}

TEST(DeriveProductTest, MissingRequiredField) {
    EXPECT_EQ(decode_err<User>(R"({"id": 1, "tags": []})"), ".login(missing)");
}

TEST(DeriveProductTest, FieldErrorsCarryThePath) {
    EXPECT_EQ(decode_err<User>(R"({"id": 1, "login": "a", "tags": ["x", 2]})"),
              ".tags[1](expected '\"' got '2')");
    EXPECT_EQ(decode_err<std::vector<User>>(R"([{"id": 1, "login": "a", "tags": []}, {"id": "x"}])"),
              "[1].id(expected a number)");
}

TEST(DeriveProductTest, EmptyProductAcceptsAnyValueUnlessStrict) {
    EXPECT_TRUE(is_ok(from_json<Dot>(R"({"anything": [1, 2]})")));
    EXPECT_TRUE(is_ok(from_json<Dot>("5")));

    EXPECT_TRUE(is_ok(from_json<Stop>("{}")));
    EXPECT_EQ(decode_err<Stop>(R"({"x": 1})"), "(expected '}' got '\"')");
}

TEST(DeriveProductTest, FieldWithExplicitCodec) {
    Codec<int> as_text{
        contramap<int>(encoder<std::string>(), [](int n) { return std::to_string(n); }),
        map_or_fail<int>(decoder<std::string>(), [](const std::string& s) -> Result<int> {
            try {
                return std::stoi(s);
            } catch (const std::exception&) {
                return std::string("not a number");
            }
        })};
    auto codec = derive::product<Reading>().field_with("code", &Reading::code, as_text).build();

    EXPECT_EQ(codec.encoder->encode(Reading{42}), R"({"code":"42"})");

    auto decoded = codec.decoder->decode(R"({"code": "17"})");
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).code, 17);

    auto bad = codec.decoder->decode(R"({"code": "x"})");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).to_string(), ".code(not a number)");
}

// ============================================================================
// Wrapped Sums
// ============================================================================

TEST(DeriveSumTest, WrappedEncoding) {
    EXPECT_EQ(to_json(Command(Move{1, 2})), R"({"Move":{"dx":1,"dy":2}})");
    EXPECT_EQ(to_json(Command(Stop{})), R"({"Stop":{}})");
    EXPECT_EQ(to_json_pretty(Command(Move{1, 2})), "{\n"
                                                   "  \"Move\" : {\n"
                                                   "    \"dx\" : 1,\n"
                                                   "    \"dy\" : 2\n"
                                                   "  }\n"
                                                   "}");
}

TEST(DeriveSumTest, WrappedDecoding) {
    auto move = decode_ok<Command>(R"({"Move": {"dy": 4, "dx": 3}})");
    ASSERT_TRUE(std::holds_alternative<Move>(move));
    EXPECT_EQ(std::get<Move>(move).dx, 3);

    auto stop = decode_ok<Command>(R"({"Stop": {}})");
    EXPECT_TRUE(std::holds_alternative<Stop>(stop));
}

TEST(DeriveSumTest, WrappedDecodingErrors) {
    EXPECT_EQ(decode_err<Command>("{}"), "(expected non-empty object)");
    EXPECT_EQ(decode_err<Command>(R"({"Jump": {}})"), "(invalid disambiguator)");
    EXPECT_EQ(decode_err<Command>(R"({"Move": {"dx": 1}})"), ".Move.dy(missing)");
    EXPECT_EQ(decode_err<Command>(R"({"Stop": {}, "Move": {}})"), "(expected '}' got ',')");
    EXPECT_EQ(decode_err<Command>("[]"), "(expected '{' got '[')");
}

// ============================================================================
// Discriminated Sums
// ============================================================================

TEST(DeriveSumTest, DiscriminatorIsMergedIntoTheObject) {
    EXPECT_EQ(to_json(Shape(Circle{1.5})), R"({"type":"Circle","radius":1.5})");
    EXPECT_EQ(to_json(Shape(Rect{1.0, 2.0, "box"})),
              R"({"type":"rectangle","w":1.0,"h":2.0,"label":"box"})");
}

TEST(DeriveSumTest, EmptyVariantGetsNoSeparator) {
    EXPECT_EQ(to_json(Shape(Dot{})), R"({"type":"Dot"})");
}

TEST(DeriveSumTest, SeparatorFollowsTheFirstWrittenMember) {
    // The first member of the variant is skipped; the comma must still appear once
    struct Labelled {
        std::optional<std::string> label;
        int n = 0;
    };
    auto inner = derive::product<Labelled>()
                     .field("label", &Labelled::label)
                     .field("n", &Labelled::n)
                     .build();

    StringWriter out;
    out.write("{\"type\":\"L\"");
    NestedObjectWriter nested(out, std::nullopt);
    inner.encoder->unsafe_encode(Labelled{std::nullopt, 3}, std::nullopt, nested);
    EXPECT_EQ(out.str(), R"({"type":"L","n":3})");
}

TEST(DeriveSumTest, DiscriminatedPrettyLayout) {
    EXPECT_EQ(to_json_pretty(Shape(Circle{1.5})), "{\n"
                                                  "  \"type\" : \"Circle\",\n"
                                                  "  \"radius\" : 1.5\n"
                                                  "}");
}

TEST(DeriveSumTest, DiscriminatedDecodingWithHintFirst) {
    auto shape = decode_ok<Shape>(R"({"type": "rectangle", "w": 3, "h": 4})");
    ASSERT_TRUE(std::holds_alternative<Rect>(shape));
    EXPECT_DOUBLE_EQ(std::get<Rect>(shape).h, 4.0);
}

TEST(DeriveSumTest, DiscriminatedDecodingReplaysEarlierFields) {
    auto shape = decode_ok<Shape>(
        R"({"w": 3, "label": "{\"type\": \"Circle\"}", "h": 4, "type": "rectangle"})");
    ASSERT_TRUE(std::holds_alternative<Rect>(shape));
    const auto& rect = std::get<Rect>(shape);
    EXPECT_DOUBLE_EQ(rect.w, 3.0);
    EXPECT_EQ(rect.label, std::optional<std::string>("{\"type\": \"Circle\"}"));
}

TEST(DeriveSumTest, DiscriminatedValuesInsideContainers) {
    auto shapes = decode_ok<std::vector<Shape>>(
        R"([{"radius": 1, "type": "Circle"}, {"type": "Dot"}, {"type": "Circle", "radius": 2}])");
    ASSERT_EQ(shapes.size(), 3u);
    EXPECT_DOUBLE_EQ(std::get<Circle>(shapes[0]).radius, 1.0);
    EXPECT_TRUE(std::holds_alternative<Dot>(shapes[1]));
    EXPECT_DOUBLE_EQ(std::get<Circle>(shapes[2]).radius, 2.0);
}

TEST(DeriveSumTest, DiscriminatedDecodingFromStream) {
    std::istringstream in(R"({"radius": 2.5, "type": "Circle"}   )");
    auto result = read_json<Shape>(in);
    ASSERT_TRUE(is_ok(result));
    EXPECT_DOUBLE_EQ(std::get<Circle>(unwrap(result)).radius, 2.5);
}

TEST(DeriveSumTest, DiscriminatedDecodingErrors) {
    EXPECT_EQ(decode_err<Shape>(R"({"radius": 2})"), "(missing hint 'type')");
    EXPECT_EQ(decode_err<Shape>(R"({"type": "Hexagon"})"), "(invalid disambiguator)");
    EXPECT_EQ(decode_err<Shape>(R"({"type": "Circle"})"), "{Circle}.radius(missing)");
    EXPECT_EQ(decode_err<std::vector<Shape>>(R"([{"type": "Dot"}, {"type": "Circle", "radius": "x"}])"),
              "[1]{Circle}.radius(expected a number)");
}

TEST(DeriveSumTest, EncodedValuesDecodeBack) {
    std::vector<Shape> shapes = {Circle{0.5}, Rect{1, 2, std::nullopt}, Dot{}};
    auto decoded = decode_ok<std::vector<Shape>>(to_json(shapes));
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_DOUBLE_EQ(std::get<Circle>(decoded[0]).radius, 0.5);
    EXPECT_FALSE(std::get<Rect>(decoded[1]).label.has_value());
    EXPECT_TRUE(std::holds_alternative<Dot>(decoded[2]));

    auto pretty = decode_ok<std::vector<Shape>>(to_json_pretty(shapes));
    EXPECT_EQ(pretty.size(), 3u);
}

TEST(DeriveSumTest, StrictVariantRejectsTheDiscriminator) {
    using Only = std::variant<Strict>;
    auto codec = derive::sum<Only>().variant<Strict>("Strict").discriminator("kind").build();
    auto result = codec.decoder->decode(R"({"kind": "Strict", "a": 1})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).to_string(), "{Strict}(invalid extra field)");
}

// ============================================================================
// Builder Misuse
// ============================================================================

TEST(DeriveBuilderTest, MissingAlternativeThrows) {
    auto builder = derive::sum<Shape>().variant<Circle>("Circle").variant<Dot>("Dot");
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST(DeriveBuilderTest, DuplicateVariantNameThrows) {
    auto builder = derive::sum<Command>().variant<Move>("Go").variant<Stop>("Go");
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST(DeriveBuilderTest, RegisteringAnAlternativeTwiceThrows) {
    auto builder = derive::sum<Command>().variant<Move>("Move");
    EXPECT_THROW(builder.variant<Move>("Move2"), std::logic_error);
}

TEST(DeriveBuilderTest, DuplicateFieldNameThrows) {
    auto builder = derive::product<Move>().field("dx", &Move::dx);
    EXPECT_THROW(builder.field("dy", &Move::dy, "dx"), std::logic_error);
}
