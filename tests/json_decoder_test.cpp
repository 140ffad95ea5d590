//! # Decoder Tests
//!
//! Built-in instances, error traces, missing-field fallbacks, combinators
//! and the stream entry point.

#include "common.hpp"

#include "json/json.hpp"
#include <cmath>
#include <deque>
#include <gtest/gtest.h>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using namespace jcodec;
using namespace jcodec::json;

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
// Scalars
// ============================================================================

TEST(JsonDecoderTest, Booleans) {
    EXPECT_TRUE(decode_ok<bool>("true"));
    EXPECT_FALSE(decode_ok<bool>(" false "));
    EXPECT_EQ(decode_err<bool>("1"), "(expected a boolean)");
}

TEST(JsonDecoderTest, Integers) {
    EXPECT_EQ(decode_ok<int>("-17"), -17);
    EXPECT_EQ(decode_ok<uint64_t>("18446744073709551615"), 18446744073709551615ULL);
    EXPECT_EQ(decode_ok<int8_t>("127"), 127);
}

TEST(JsonDecoderTest, IntegersAreRangeChecked) {
    EXPECT_EQ(decode_err<int8_t>("128"), "(out of range)");
    EXPECT_EQ(decode_err<uint32_t>("-1"), "(out of range)");
    EXPECT_EQ(decode_err<int64_t>("18446744073709551615"), "(out of range)");
    EXPECT_EQ(decode_err<int>("1.5"), "(expected an integer)");
    EXPECT_EQ(decode_err<int>("1e2"), "(expected an integer)");
}

TEST(JsonDecoderTest, Doubles) {
    EXPECT_DOUBLE_EQ(decode_ok<double>("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(decode_ok<double>("3"), 3.0);
    EXPECT_DOUBLE_EQ(decode_ok<double>("-1.25e-2"), -0.0125);
    EXPECT_FLOAT_EQ(decode_ok<float>("0.5"), 0.5f);
}

TEST(JsonDecoderTest, NonFiniteDoublesFromStrings) {
    EXPECT_TRUE(std::isnan(decode_ok<double>(R"("NaN")")));
    EXPECT_EQ(decode_ok<double>(R"("Infinity")"), std::numeric_limits<double>::infinity());
    EXPECT_EQ(decode_ok<double>(R"("-Infinity")"), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(decode_err<double>(R"("nan")"), "(expected a number)");
}

TEST(JsonDecoderTest, OverflowingLiteralsAreNotInfinity) {
    EXPECT_EQ(decode_err<double>("1e400"), "(number out of range)");
    EXPECT_EQ((decode_err<std::vector<double>>("[1, -1e999]")), "[1](number out of range)");
    EXPECT_EQ(decode_ok<double>("1e-400"), 0.0);
}

TEST(JsonDecoderTest, NonFiniteDoublesRoundTrip) {
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(decode_ok<double>(to_json(inf)), inf);
    EXPECT_TRUE(std::isnan(decode_ok<double>(to_json(std::nan("")))));
}

TEST(JsonDecoderTest, StringsAndChars) {
    EXPECT_EQ(decode_ok<std::string>(R"("aA\t")"), "aA\t");
    EXPECT_EQ(decode_ok<char>(R"("z")"), 'z');
    EXPECT_EQ(decode_err<char>(R"("zz")"), "(expected one character)");
    EXPECT_FALSE(decode_err<std::string>("12").empty());
}

TEST(JsonDecoderTest, TrailingContentIsRejected) {
    EXPECT_EQ(decode_err<int>("1 2"), "(unexpected trailing content)");
    EXPECT_EQ(decode_ok<int>("  1  \n"), 1);
}

// ============================================================================
// Containers
// ============================================================================

TEST(JsonDecoderTest, Sequences) {
    EXPECT_EQ(decode_ok<std::vector<int>>("[1, 2, 3]"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(decode_ok<std::vector<int>>("[]"), std::vector<int>{});
    EXPECT_EQ(decode_ok<std::list<std::string>>(R"(["a","b"])"),
              (std::list<std::string>{"a", "b"}));
    EXPECT_EQ(decode_ok<std::deque<bool>>("[true]"), std::deque<bool>{true});
    EXPECT_EQ(decode_ok<std::set<int>>("[3, 1, 3]"), (std::set<int>{1, 3}));
    EXPECT_EQ(decode_ok<std::unordered_set<std::string>>(R"(["x"])").count("x"), 1u);
}

TEST(JsonDecoderTest, SequenceErrorsCarryTheIndex) {
    EXPECT_EQ(decode_err<std::vector<int>>(R"([1, 2, "x"])"), "[2](expected a number)");
    EXPECT_EQ(decode_err<std::vector<std::vector<int>>>("[[1], [2, true]]"),
              "[1][1](expected a number)");
}

TEST(JsonDecoderTest, Maps) {
    auto m = decode_ok<std::map<std::string, int>>(R"({"b": 2, "a": 1})");
    EXPECT_EQ(m, (std::map<std::string, int>{{"a", 1}, {"b", 2}}));

    auto last_wins = decode_ok<std::unordered_map<std::string, int>>(R"({"a": 1, "a": 5})");
    EXPECT_EQ(last_wins.at("a"), 5);

    auto keyed = decode_ok<std::map<int, std::string>>(R"({"10": "ten", "-2": "minus two"})");
    EXPECT_EQ(keyed.at(10), "ten");
    EXPECT_EQ(keyed.at(-2), "minus two");
}

TEST(JsonDecoderTest, MapErrorsCarryTheKey) {
    EXPECT_EQ((decode_err<std::map<std::string, int>>(R"({"a": 1, "b": null})")),
              ".b(expected a number)");
    EXPECT_EQ((decode_err<std::map<int, int>>(R"({"x1": 1})")), ".x1(invalid key)");
}

TEST(JsonDecoderTest, Optionals) {
    EXPECT_EQ(decode_ok<std::optional<int>>("null"), std::nullopt);
    EXPECT_EQ(decode_ok<std::optional<int>>("4"), 4);
    EXPECT_EQ(decode_ok<std::vector<std::optional<int>>>("[1, null]"),
              (std::vector<std::optional<int>>{1, std::nullopt}));
    EXPECT_EQ(decode_err<std::optional<int>>("nul"), "(expected 'null')");
}

TEST(JsonDecoderTest, MissingFallbacks) {
    DecodeTrace trace = DecodeTrace().with_field("age");
    auto required = decoder<int>()->decode_missing(trace);
    ASSERT_TRUE(is_err(required));
    EXPECT_EQ(unwrap_err(required).to_string(), ".age(missing)");

    auto optional = decoder<std::optional<int>>()->decode_missing(trace);
    ASSERT_TRUE(is_ok(optional));
    EXPECT_FALSE(unwrap(optional).has_value());
}

TEST(JsonDecoderTest, Tuples) {
    auto pair = decode_ok<std::pair<int, std::string>>(R"([1, "x"])");
    EXPECT_EQ(pair.first, 1);
    EXPECT_EQ(pair.second, "x");

    auto triple = decode_ok<std::tuple<bool, double, char>>(R"([true, 2.5, "c"])");
    EXPECT_EQ(triple, std::make_tuple(true, 2.5, 'c'));
}

TEST(JsonDecoderTest, TuplesHaveFixedLength) {
    EXPECT_EQ((decode_err<std::pair<int, int>>("[1]")), "(expected ',' got ']')");
    EXPECT_EQ((decode_err<std::pair<int, int>>("[1, 2, 3]")), "(expected ']' got ',')");
    EXPECT_EQ((decode_err<std::pair<int, int>>(R"([1, "2"])")), "[1](expected a number)");
}

TEST(JsonDecoderTest, JsonValues) {
    auto v = decode_ok<JsonValue>(R"({"a": [1, "b"]})");
    EXPECT_EQ(v, json_object({{"a", json_array({json_int(1), json_string("b")})}}));

    auto list = decode_ok<std::vector<JsonValue>>(R"([null, {}])");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_TRUE(list[1].is_object());
}

// ============================================================================
// Combinators
// ============================================================================

namespace {

struct Port {
    uint16_t value = 0;
};

auto port_decoder() -> DecoderRef<Port> {
    return map_or_fail<Port>(decoder<int64_t>(), [](int64_t n) -> Result<Port> {
        if (n <= 0 || n > 65535) {
            return std::string("not a port");
        }
        return Port{static_cast<uint16_t>(n)};
    });
}

} // namespace

TEST(JsonDecoderTest, Map) {
    auto dec = map<std::string>(decoder<int>(), [](int n) { return std::to_string(n * 2); });
    auto result = dec->decode("21");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "42");
}

TEST(JsonDecoderTest, MapOrFail) {
    auto ok = port_decoder()->decode("8080");
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).value, 8080);

    auto bad = port_decoder()->decode("70000");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).to_string(), "(not a port)");
}

TEST(JsonDecoderTest, XmapUsesOnlyTheForwardFunction) {
    int reverse_calls = 0;
    auto dec = xmap<Port>(
        decoder<int>(), [](int n) { return Port{static_cast<uint16_t>(n)}; },
        [&reverse_calls](const Port& p) {
            ++reverse_calls;
            return static_cast<int>(p.value);
        });
    auto result = dec->decode("443");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).value, 443);
    EXPECT_EQ(reverse_calls, 0);
}

// ============================================================================
// Entry Points
// ============================================================================

TEST(JsonDecoderTest, ReadJsonFromStream) {
    std::istringstream in(R"({"a": [1, 2]})");
    auto result = read_json<std::map<std::string, std::vector<int>>>(in);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).at("a"), (std::vector<int>{1, 2}));
}

TEST(JsonDecoderTest, ReadJsonReportsErrors) {
    std::istringstream in("[1, x]");
    auto result = read_json<std::vector<int>>(in);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).to_string(), "[1](expected a number)");
}

TEST(JsonDecoderTest, ParserHonorsDepthLimit) {
    size_t saved = CodecOptions::max_depth;
    CodecOptions::max_depth = 4;
    auto deep = parse_json("[[[[[1]]]]]");
    auto shallow = parse_json("[[[1]]]");
    CodecOptions::max_depth = saved;

    ASSERT_TRUE(is_err(deep));
    EXPECT_EQ(unwrap_err(deep).message, "maximum nesting depth exceeded");
    EXPECT_TRUE(is_ok(shallow));
}
