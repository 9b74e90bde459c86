// test_xml_adapter.cpp - Tests for the XML reader

#include <catch2/catch_all.hpp>
#include <confdiff/xml_adapter.h>

#include <limits>

using namespace confdiff;

namespace {

Value parse_ok(const std::string& text, const ParseOptions& options = {})
{
    auto result = parse_xml(text, options);
    REQUIRE(result.ok());
    return result.value;
}

std::string parse_error_text(const std::string& text)
{
    auto result = parse_xml(text);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error->format() == Format::Xml);
    return result.error->what();
}

} // namespace

TEST_CASE("XML elements become mappings", "[xml]") {
    Value doc = parse_ok("<root><server><host>localhost</host><port>8080</port></server></root>");

    REQUIRE(doc.is_map());
    REQUIRE_FALSE(doc.contains("root"));
    REQUIRE(doc.at("server").at("host").at(xml_text_key).as_string() == "localhost");
    // All XML content is text
    REQUIRE(doc.at("server").at("port").at(xml_text_key).as_string() == "8080");
}

TEST_CASE("XML text handling", "[xml][text]") {
    SECTION("text is trimmed and blank text dropped") {
        Value doc = parse_ok("<root>\n  <a>  padded  </a>\n  <b>   </b>\n</root>");

        REQUIRE_FALSE(doc.contains(xml_text_key));
        REQUIRE(doc.at("a").at(xml_text_key).as_string() == "padded");
        REQUIRE(doc.at("b").is_map());
        REQUIRE(doc.at("b").size() == 0);
    }

    SECTION("empty element is an empty mapping") {
        Value doc = parse_ok("<root><flag/></root>");
        REQUIRE(doc.at("flag").is_map());
        REQUIRE(doc.at("flag").size() == 0);
    }

    SECTION("only text before the first child counts") {
        Value doc = parse_ok("<root>lead<child/>tail</root>");
        REQUIRE(doc.at(xml_text_key).as_string() == "lead");
    }

    SECTION("comments are skipped and CDATA is text") {
        REQUIRE(parse_ok("<root>a<!-- note -->b</root>").at(xml_text_key).as_string() == "ab");
        REQUIRE(parse_ok("<root><![CDATA[ <raw> ]]></root>").at(xml_text_key).as_string() == "<raw>");
    }

    SECTION("predefined entities are decoded") {
        REQUIRE(parse_ok("<root>a &amp; b</root>").at(xml_text_key).as_string() == "a & b");
    }
}

TEST_CASE("XML repeated tags become sequences", "[xml][sequence]") {
    SECTION("two siblings keep document order") {
        Value doc = parse_ok("<root><item>1</item><item>2</item></root>");

        Value items = doc.at("item");
        REQUIRE(items.is_vector());
        REQUIRE(items.size() == 2);
        REQUIRE(items.at(std::size_t{0}).at(xml_text_key).as_string() == "1");
        REQUIRE(items.at(std::size_t{1}).at(xml_text_key).as_string() == "2");
    }

    SECTION("further siblings are appended") {
        Value doc = parse_ok("<root><item>1</item><other/><item>2</item><item>3</item></root>");

        REQUIRE(doc.as_map().entry_at(0).key == "item");
        REQUIRE(doc.at("item").size() == 3);
        REQUIRE(doc.at("item").at(std::size_t{2}).at(xml_text_key).as_string() == "3");
    }

    SECTION("a single child stays a mapping") {
        Value doc = parse_ok("<root><item>1</item></root>");
        REQUIRE(doc.at("item").is_map());
    }

    SECTION("a child named text joins the element text") {
        Value doc = parse_ok("<root>hello<text>inner</text></root>");

        Value text = doc.at(xml_text_key);
        REQUIRE(text.is_vector());
        REQUIRE(text.at(std::size_t{0}).as_string() == "hello");
        REQUIRE(text.at(std::size_t{1}).at(xml_text_key).as_string() == "inner");
    }
}

TEST_CASE("XML attributes", "[xml][attributes]") {
    const std::string text = R"(<root><db host="h" port="5432">main</db></root>)";

    SECTION("ignored by default") {
        Value doc = parse_ok(text);
        REQUIRE_FALSE(doc.at("db").contains(xml_attributes_key));
        REQUIRE(doc.at("db").size() == 1);
    }

    SECTION("folded into @attrs on request") {
        ParseOptions options;
        options.xml_attributes = true;

        Value db = parse_ok(text, options).at("db");
        REQUIRE(db.at(xml_text_key).as_string() == "main");
        REQUIRE(db.at(xml_attributes_key).at("host").as_string() == "h");
        REQUIRE(db.at(xml_attributes_key).at("port").as_string() == "5432");
    }
}

TEST_CASE("XML namespaces use Clark notation", "[xml][namespace]") {
    Value doc = parse_ok(R"(<root xmlns:n="urn:x"><n:a>1</n:a><b/></root>)");
    REQUIRE(doc.contains("{urn:x}a"));
    REQUIRE(doc.contains("b"));
}

TEST_CASE("XML errors", "[xml][error]") {
    SECTION("mismatched tags") {
        REQUIRE_THAT(parse_error_text("<root><a></root>"),
                     Catch::Matchers::StartsWith("Invalid XML format: "));
    }

    SECTION("plain text") {
        REQUIRE_THAT(parse_error_text("hello"),
                     Catch::Matchers::StartsWith("Invalid XML format: "));
    }

    SECTION("empty document") {
        REQUIRE_THAT(parse_error_text(""),
                     Catch::Matchers::StartsWith("Invalid XML format: "));
    }
}

TEST_CASE("XML nesting limit", "[xml][depth]") {
    ParseOptions options;
    options.max_depth = 2;

    REQUIRE(parse_xml("<r><a><b/></a></r>", options).ok());

    auto result = parse_xml("<r><a><b><c/></b></a></r>", options);
    REQUIRE_FALSE(result.ok());
    REQUIRE_THAT(result.error->message(), Catch::Matchers::ContainsSubstring("maximum nesting depth"));
}

TEST_CASE("XML documents beyond the libxml2 size limit", "[.][xml][large]") {
    const std::string huge(static_cast<std::size_t>(std::numeric_limits<int>::max()) + 1, ' ');

    auto result = parse_xml(huge);
    REQUIRE_FALSE(result.ok());
    REQUIRE_THAT(result.error->message(), Catch::Matchers::StartsWith("document exceeds 2147483647 bytes"));
}
