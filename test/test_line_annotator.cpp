// test_line_annotator.cpp - Tests for per-line change markers

#include <catch2/catch_all.hpp>
#include <confdiff/line_annotator.h>

using namespace confdiff;

using Lines = std::vector<std::string>;

TEST_CASE("split_lines", "[annotate]") {
    REQUIRE(split_lines("a\nb") == Lines{"a", "b"});
    REQUIRE(split_lines("a\n") == Lines{"a", ""});
    REQUIRE(split_lines("") == Lines{""});
    REQUIRE(split_lines("a\r\nb") == Lines{"a\r", "b"});
}

TEST_CASE("substring annotation of a JSON document", "[annotate][substring]") {
    const std::string source = "{\n  \"a\": 1,\n  \"b\": 2\n}";
    const std::string target = "{\n  \"a\": 1,\n  \"b\": 3,\n  \"c\": 4\n}";

    ChangeList changes{
        ChangeRecord::modification(ChangePath{"b"}, Value{2}, Value{3}),
        ChangeRecord::addition(ChangePath{"c"}, Value{4}),
    };

    AnnotatedText annotated = annotate(source, target, changes);

    REQUIRE(annotated.source == Lines{
        "  {",
        "    \"a\": 1,",
        "~   \"b\": 2",
        "  }",
    });
    REQUIRE(annotated.target == Lines{
        "  {",
        "    \"a\": 1,",
        "~   \"b\": 3,",
        "+   \"c\": 4",
        "  }",
    });
}

TEST_CASE("substring annotation markers", "[annotate][substring]") {
    SECTION("deletion wins over modification on the source side") {
        ChangeList changes{
            ChangeRecord::deletion(ChangePath{"port"}, Value{1}),
            ChangeRecord::modification(ChangePath{"port_range"}, Value{1}, Value{2}),
        };
        AnnotatedText annotated = annotate("port_range: 1", "port_range: 2", changes, AnnotateMode::Substring, Format::Yaml);

        REQUIRE(annotated.source == Lines{"- port_range: 1"});
        REQUIRE(annotated.target == Lines{"~ port_range: 2"});
    }

    SECTION("every fragment of a nested path is matched") {
        ChangeList changes{
            ChangeRecord::modification(ChangePath{"server", "port"}, Value{1}, Value{2}),
        };
        AnnotatedText annotated = annotate("server:\n  port: 1\nname: x", "server:\n  port: 2\nname: x", changes);

        REQUIRE(annotated.source == Lines{"~ server:", "~   port: 1", "  name: x"});
        REQUIRE(annotated.target == Lines{"~ server:", "~   port: 2", "  name: x"});
    }

    SECTION("additions never mark source lines") {
        ChangeList changes{ChangeRecord::addition(ChangePath{"c"}, Value{4})};
        AnnotatedText annotated = annotate("c", "c", changes);

        REQUIRE(annotated.source == Lines{"  c"});
        REQUIRE(annotated.target == Lines{"+ c"});
    }

    SECTION("a root-level change matches the root fragment") {
        ChangeList changes{ChangeRecord::modification(ChangePath{}, Value{1}, Value{2})};
        AnnotatedText annotated = annotate("<root>1</root>", "<root>2</root>", changes);

        REQUIRE(annotated.source == Lines{"~ <root>1</root>"});
    }

    SECTION("root element lines match the root fragment") {
        ChangeList changes{
            ChangeRecord::modification(ChangePath{"a", "text"}, Value{"1"}, Value{"2"}),
        };
        AnnotatedText annotated = annotate("<root>\n  <a>1</a>\n  <b>x</b>\n</root>",
                                           "<root>\n  <a>2</a>\n  <b>x</b>\n</root>",
                                           changes, AnnotateMode::Substring, Format::Xml);

        REQUIRE(annotated.source == Lines{"~ <root>", "~   <a>1</a>", "    <b>x</b>", "~ </root>"});
        REQUIRE(annotated.target == Lines{"~ <root>", "~   <a>2</a>", "    <b>x</b>", "~ </root>"});

        AnnotatedText key_aware = annotate("<root>\n  <a>1</a>\n</root>", "<root/>",
                                           changes, AnnotateMode::KeyAware, Format::Xml);
        REQUIRE(key_aware.source == Lines{"  <root>", "~   <a>1</a>", "  </root>"});
    }

    SECTION("an empty key fragment matches every line") {
        ChangeList changes{ChangeRecord::deletion(ChangePath{""}, Value{1})};
        AnnotatedText annotated = annotate("{\n\"\": 1,\n\"b\": 2\n}", "{\"b\": 2}", changes,
                                           AnnotateMode::Substring, Format::Json);

        REQUIRE(annotated.source == Lines{"- {", "- \"\": 1,", "- \"b\": 2", "- }"});
        REQUIRE(annotated.target == Lines{"  {\"b\": 2}"});
    }

    SECTION("no changes leaves every line unmarked") {
        AnnotatedText annotated = annotate("a\nb", "a\nb", {});
        REQUIRE(annotated.source == Lines{"  a", "  b"});
        REQUIRE(annotated.target == Lines{"  a", "  b"});
    }
}

TEST_CASE("key-aware annotation", "[annotate][keyaware]") {
    SECTION("JSON matches quoted keys only") {
        ChangeList changes{ChangeRecord::modification(ChangePath{"b"}, Value{2}, Value{3})};
        const std::string source = "{\n  \"abc\": 1,\n  \"b\": 2\n}";

        AnnotatedText substring = annotate(source, source, changes, AnnotateMode::Substring, Format::Json);
        AnnotatedText key_aware = annotate(source, source, changes, AnnotateMode::KeyAware, Format::Json);

        REQUIRE(substring.source[1] == "~   \"abc\": 1,");
        REQUIRE(key_aware.source[1] == "    \"abc\": 1,");
        REQUIRE(key_aware.source[2] == "~   \"b\": 2");
    }

    SECTION("YAML matches key followed by a colon") {
        ChangeList changes{ChangeRecord::deletion(ChangePath{"server", "port"}, Value{1})};
        AnnotatedText annotated = annotate("server:\n  port: 1\n  port_alt: 2", "server: {}", changes,
                                           AnnotateMode::KeyAware, Format::Yaml);

        REQUIRE(annotated.source == Lines{"  server:", "-   port: 1", "    port_alt: 2"});
    }

    SECTION("XML matches element tags") {
        ChangeList changes{ChangeRecord::modification(ChangePath{"port", "text"}, Value{"1"}, Value{"2"})};
        AnnotatedText annotated = annotate("<cfg>\n<port>1</port>\n<portal>x</portal>\n</cfg>",
                                           "<cfg>\n<port id=\"p\">2</port>\n</cfg>", changes,
                                           AnnotateMode::KeyAware, Format::Xml);

        REQUIRE(annotated.source == Lines{"  <cfg>", "~ <port>1</port>", "  <portal>x</portal>", "  </cfg>"});
        REQUIRE(annotated.target == Lines{"  <cfg>", "~ <port id=\"p\">2</port>", "  </cfg>"});
    }

    SECTION("XML attributes match name=") {
        ChangeList changes{ChangeRecord::modification(ChangePath{"db", "@attrs", "host"}, Value{"a"}, Value{"b"})};
        AnnotatedText annotated = annotate("<r>\n<db host=\"a\"/>\n<hostname/>\n</r>", "<r/>", changes,
                                           AnnotateMode::KeyAware, Format::Xml);

        REQUIRE(annotated.source == Lines{"  <r>", "~ <db host=\"a\"/>", "  <hostname/>", "  </r>"});
    }

    SECTION("index segments use the owning key") {
        ChangePath path{"items"};
        path.push_back(std::size_t{1});
        ChangeList changes{ChangeRecord::addition(path, Value{5})};

        AnnotatedText annotated = annotate("items: [1]", "items: [1, 5]", changes, AnnotateMode::KeyAware, Format::Yaml);
        REQUIRE(annotated.target == Lines{"+ items: [1, 5]"});
    }
}
