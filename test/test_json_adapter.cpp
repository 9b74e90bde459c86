// test_json_adapter.cpp - Tests for the JSON reader

#include <catch2/catch_all.hpp>
#include <confdiff/json_adapter.h>

#include <cmath>
#include <string>

using namespace confdiff;

namespace {

Value parse_ok(const std::string& text)
{
    auto result = parse_json(text);
    REQUIRE(result.ok());
    return result.value;
}

std::string parse_error_text(const std::string& text, const ParseOptions& options = {})
{
    auto result = parse_json(text, options);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error->format() == Format::Json);
    return result.error->what();
}

} // namespace

TEST_CASE("JSON scalars", "[json][scalar]") {
    Value doc = parse_ok(R"({"i": 42, "neg": -7, "f": 1.5, "exp": 1e3, "t": true, "f2": false, "n": null, "s": "x"})");

    REQUIRE(doc.at("i").as_int() == 42);
    REQUIRE(doc.at("neg").as_int() == -7);
    REQUIRE(doc.at("f").as_double() == 1.5);
    REQUIRE(doc.at("exp").is_double());
    REQUIRE(doc.at("exp").as_double() == 1000.0);
    REQUIRE(doc.at("t").as_bool() == true);
    REQUIRE(doc.at("f2").is_bool());
    REQUIRE(doc.at("n").is_null());
    REQUIRE(doc.at("s").as_string() == "x");
}

TEST_CASE("JSON integer and float stay distinct", "[json][scalar]") {
    Value doc = parse_ok(R"({"a": 1, "b": 1.0})");
    REQUIRE(doc.at("a").is_int());
    REQUIRE(doc.at("b").is_double());
}

TEST_CASE("JSON numbers beyond int64 become doubles", "[json][scalar]") {
    Value doc = parse_ok("[123456789012345678901]");
    REQUIRE(doc.at(std::size_t{0}).is_double());
}

TEST_CASE("JSON numbers outside the double range", "[json][scalar]") {
    Value doc = parse_ok("[1e-400, -1e-400, 1e400, -1E+400, 0." + std::string(400, '0') + "1]");

    REQUIRE(doc.at(std::size_t{0}).as_double() == 0.0);
    REQUIRE_FALSE(std::signbit(doc.at(std::size_t{0}).as_double()));
    REQUIRE(doc.at(std::size_t{1}).as_double() == 0.0);
    REQUIRE(std::signbit(doc.at(std::size_t{1}).as_double()));
    REQUIRE(std::isinf(doc.at(std::size_t{2}).as_double()));
    REQUIRE(doc.at(std::size_t{2}).as_double() > 0);
    REQUIRE(doc.at(std::size_t{3}).as_double() < 0);
    REQUIRE(doc.at(std::size_t{4}).as_double() == 0.0);
}

TEST_CASE("JSON non-finite constants", "[json][scalar]") {
    Value doc = parse_ok("[NaN, Infinity, -Infinity]");
    REQUIRE(std::isnan(doc.at(std::size_t{0}).as_double()));
    REQUIRE(doc.at(std::size_t{1}).as_double() > 0);
    REQUIRE(std::isinf(doc.at(std::size_t{2}).as_double()));
    REQUIRE(doc.at(std::size_t{2}).as_double() < 0);
}

TEST_CASE("JSON strings", "[json][string]") {
    Value doc = parse_ok(R"(["a\"b", "tab\there", "\u00e9", "\ud83d\ude00", "\/"])");

    REQUIRE(doc.at(std::size_t{0}).as_string() == "a\"b");
    REQUIRE(doc.at(std::size_t{1}).as_string() == "tab\there");
    REQUIRE(doc.at(std::size_t{2}).as_string() == "\xC3\xA9");
    REQUIRE(doc.at(std::size_t{3}).as_string() == "\xF0\x9F\x98\x80");
    REQUIRE(doc.at(std::size_t{4}).as_string() == "/");
}

TEST_CASE("JSON objects", "[json][object]") {
    SECTION("key order follows the document") {
        Value doc = parse_ok(R"({"z": 1, "a": {"y": [1, 2], "b": {}}})");

        REQUIRE(doc.as_map().entry_at(0).key == "z");
        REQUIRE(doc.as_map().entry_at(1).key == "a");
        REQUIRE(doc.at("a").at("y").size() == 2);
        REQUIRE(doc.at("a").at("b").is_map());
        REQUIRE(doc.at("a").at("b").size() == 0);
    }

    SECTION("duplicate keys keep the last value") {
        Value doc = parse_ok(R"({"a": 1, "b": 2, "a": 3})");
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.as_map().entry_at(0).key == "a");
        REQUIRE(doc.at("a").as_int() == 3);
    }

    SECTION("non-object roots are accepted") {
        REQUIRE(parse_ok("[]").is_vector());
        REQUIRE(parse_ok("  \"s\"  ").as_string() == "s");
        REQUIRE(parse_ok("3").as_int() == 3);
    }
}

TEST_CASE("JSON syntax errors", "[json][error]") {
    SECTION("missing value") {
        REQUIRE(parse_error_text(R"({"a":})") ==
                "Invalid JSON format: Expecting value: line 1 column 6 (char 5)");
    }

    SECTION("empty input") {
        REQUIRE(parse_error_text("") ==
                "Invalid JSON format: Expecting value: line 1 column 1 (char 0)");
    }

    SECTION("trailing data") {
        REQUIRE(parse_error_text("{} x") ==
                "Invalid JSON format: Extra data: line 1 column 4 (char 3)");
    }

    SECTION("position on later lines") {
        REQUIRE(parse_error_text("{\n  \"a\": 1\n  \"b\": 2\n}") ==
                "Invalid JSON format: Expecting ',' delimiter: line 3 column 3 (char 13)");
    }

    SECTION("unquoted key") {
        REQUIRE_THAT(parse_error_text("{a: 1}"),
                     Catch::Matchers::StartsWith("Invalid JSON format: Expecting property name"));
    }

    SECTION("unterminated string") {
        REQUIRE_THAT(parse_error_text(R"(["abc)"),
                     Catch::Matchers::ContainsSubstring("Unterminated string starting at"));
    }

    SECTION("bad escape") {
        REQUIRE_THAT(parse_error_text(R"(["\x"])"),
                     Catch::Matchers::ContainsSubstring("Invalid \\escape"));
    }

    SECTION("message without the prefix") {
        auto result = parse_json("[1,]");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->message() == "Expecting value: line 1 column 4 (char 3)");
    }
}

TEST_CASE("JSON nesting limit", "[json][depth]") {
    ParseOptions options;
    options.max_depth = 2;

    REQUIRE(parse_json("[[1]]", options).ok());
    REQUIRE_THAT(parse_error_text("[[[1]]]", options),
                 Catch::Matchers::ContainsSubstring("Maximum nesting depth of 2 exceeded"));
}
