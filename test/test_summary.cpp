// test_summary.cpp - Tests for change tallies

#include <catch2/catch_all.hpp>
#include <confdiff/summary.h>

using namespace confdiff;

TEST_CASE("summarize counts each kind", "[summary]") {
    SECTION("empty list") {
        Summary summary = summarize({});
        REQUIRE(summary.empty());
        REQUIRE(summary == Summary{});
    }

    SECTION("mixed list") {
        ChangeList changes{
            ChangeRecord::addition(ChangePath{"a"}, Value{1}),
            ChangeRecord::deletion(ChangePath{"b"}, Value{2}),
            ChangeRecord::modification(ChangePath{"c"}, Value{3}, Value{4}),
            ChangeRecord::addition(ChangePath{"d"}, Value{5}),
        };

        Summary summary = summarize(changes);
        REQUIRE(summary.additions == 2);
        REQUIRE(summary.deletions == 1);
        REQUIRE(summary.modifications == 1);
        REQUIRE(summary.total() == changes.size());
    }
}

TEST_CASE("summary matches the diff", "[summary][diff]") {
    Value source = Value::map({{"a", 1}, {"b", 2}, {"gone", 0}, {"secret", 1}});
    Value target = Value::map({{"a", 1}, {"b", 3}, {"c", 4}, {"secret", 2}});

    CompareOptions options;
    options.ignore_keys = {"secret"};

    ChangeList changes = diff(source, target, options);
    Summary summary = summarize(changes);

    std::size_t additions = 0, deletions = 0, modifications = 0;
    for (const auto& change : changes) {
        switch (change.kind) {
            case ChangeRecord::Kind::Addition:     ++additions; break;
            case ChangeRecord::Kind::Deletion:     ++deletions; break;
            case ChangeRecord::Kind::Modification: ++modifications; break;
        }
    }

    REQUIRE(summary.additions == additions);
    REQUIRE(summary.deletions == deletions);
    REQUIRE(summary.modifications == modifications);
    REQUIRE(summary == Summary{1, 1, 1});
}
