// test_serialization.cpp - Tests for JSON output of values, results and errors

#include <catch2/catch_all.hpp>
#include <confdiff/serialization.h>
#include <confdiff/json_adapter.h>

#include <cmath>
#include <limits>

using namespace confdiff;

// ============================================================
// Values
// ============================================================

TEST_CASE("to_json renders values", "[serialization]") {
    SECTION("compact") {
        Value v = Value::map({
            {"a", 1},
            {"b", Value::vector({true, Value{}})},
            {"c", "x\"y"},
        });
        REQUIRE(to_json(v, true) == R"({"a":1,"b":[true,null],"c":"x\"y"})");
    }

    SECTION("pretty") {
        REQUIRE(to_json(Value::map({{"a", 1}})) == "{\n  \"a\": 1\n}");
        REQUIRE(to_json(Value::map({{"a", Value::vector({1, 2})}})) ==
                "{\n  \"a\": [\n    1,\n    2\n  ]\n}");
    }

    SECTION("empty containers") {
        REQUIRE(to_json(Value::map({}), true) == "{}");
        REQUIRE(to_json(Value::vector({})) == "[]");
    }

    SECTION("control characters are escaped") {
        REQUIRE(to_json(Value{"a\nb\tc"}, true) == R"("a\nb\tc")");
        REQUIRE(to_json(Value{std::string{"\x01"}}, true) == R"("\u0001")");
    }

    SECTION("keys keep insertion order") {
        Value v = Value::map({{"z", 1}, {"a", 2}});
        REQUIRE(to_json(v, true) == R"({"z":1,"a":2})");
    }
}

TEST_CASE("format_double", "[serialization]") {
    REQUIRE(format_double(1.0) == "1.0");
    REQUIRE(format_double(1.5) == "1.5");
    REQUIRE(format_double(-0.25) == "-0.25");
    REQUIRE(format_double(0.1) == "0.1");
    REQUIRE(format_double(1e16) == "1e+16");
    REQUIRE(format_double(std::nan("")) == "NaN");
    REQUIRE(format_double(std::numeric_limits<double>::infinity()) == "Infinity");
    REQUIRE(format_double(-std::numeric_limits<double>::infinity()) == "-Infinity");
}

// ============================================================
// Results and errors
// ============================================================

TEST_CASE("to_json renders a comparison result", "[serialization][compare]") {
    CompareRequest request;
    request.source_text = R"({"a":1,"b":2})";
    request.target_text = R"({"a":1,"b":3,"c":4})";
    request.format      = Format::Json;

    CompareOutcome outcome = compare(request);
    REQUIRE(outcome.ok());

    const std::string json = to_json(*outcome.result, true);

    REQUIRE_THAT(json, Catch::Matchers::StartsWith(
        R"({"summary":{"additions":1,"deletions":0,"modifications":1},"diff":[)"));
    REQUIRE_THAT(json, Catch::Matchers::ContainsSubstring(
        R"({"path":"root.b","change_type":"modification","old_value":2,"new_value":3})"));
    REQUIRE_THAT(json, Catch::Matchers::ContainsSubstring(
        R"({"path":"root.c","change_type":"addition","new_value":4})"));
    REQUIRE_THAT(json, Catch::Matchers::ContainsSubstring(R"("formatted_diff":{"source":[)"));

    SECTION("output is valid JSON") {
        ParseResult reparsed = parse_json(json);
        REQUIRE(reparsed.ok());
        REQUIRE(reparsed.value == result_to_value(*outcome.result));
    }

    SECTION("pretty output parses to the same document") {
        ParseResult reparsed = parse_json(to_json(*outcome.result));
        REQUIRE(reparsed.ok());
        REQUIRE(reparsed.value == result_to_value(*outcome.result));
    }
}

TEST_CASE("result_to_value layout", "[serialization]") {
    CompareResult result;
    result.diff.push_back(ChangeRecord::deletion(ChangePath{"b"}, Value{2}));
    result.summary = summarize(result.diff);
    result.formatted_diff.source = {"  a: 1", "- b: 2"};
    result.formatted_diff.target = {"  a: 1"};

    Value v = result_to_value(result);

    REQUIRE(v.at("summary").at("deletions") == Value{1});
    REQUIRE(v.at("diff").size() == 1);
    REQUIRE(v.at("diff").at(0).at("change_type") == Value{"deletion"});
    REQUIRE(v.at("diff").at(0).at("old_value") == Value{2});
    REQUIRE_FALSE(v.at("diff").at(0).contains("new_value"));
    REQUIRE(v.at("formatted_diff").at("source").size() == 2);
    REQUIRE(v.at("formatted_diff").at("target").at(0) == Value{"  a: 1"});
}

TEST_CASE("to_json renders errors", "[serialization][error]") {
    SECTION("parse error") {
        CompareError error = CompareError::from_parse_error(ParseError{Format::Json, "Expecting value: line 1 column 6 (char 5)"});
        REQUIRE(to_json(error, true) ==
                R"({"error":"parse_error","format":"json","detail":"Invalid JSON format: Expecting value: line 1 column 6 (char 5)"})");
    }

    SECTION("unsupported format") {
        REQUIRE(to_json(CompareError::unsupported_format("toml"), true) ==
                R"({"error":"unsupported_format","detail":"Unsupported format: toml"})");
    }

    SECTION("internal error") {
        REQUIRE(to_json(CompareError::internal("Comparison failed: boom"), true) ==
                R"({"error":"internal_error","detail":"Comparison failed: boom"})");
    }
}
