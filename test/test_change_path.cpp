// test_change_path.cpp - Tests for ChangePath rendering

#include <catch2/catch_all.hpp>
#include <confdiff/change_path.h>

using namespace confdiff;

TEST_CASE("ChangePath rendering", "[path]") {
    SECTION("empty path is the root") {
        ChangePath path;
        REQUIRE(path.is_root());
        REQUIRE(path.to_string() == "root");
        REQUIRE(path.fragments() == std::vector<std::string>{"root"});
        REQUIRE(path.last_key() == "root");
    }

    SECTION("keys are joined with dots") {
        ChangePath path{"server", "port"};
        REQUIRE(path.depth() == 2);
        REQUIRE(path.to_string() == "root.server.port");
        REQUIRE(path.fragments() == std::vector<std::string>{"root", "server", "port"});
    }

    SECTION("indices use brackets") {
        ChangePath path{"items"};
        path.push_back(std::size_t{2});
        path.push_back(std::string{"name"});
        REQUIRE(path.to_string() == "root.items[2].name");
        REQUIRE(path.fragments() == std::vector<std::string>{"root", "items[2]", "name"});
    }
}

TEST_CASE("ChangePath key queries", "[path]") {
    ChangePath path{"items"};
    path.push_back(std::size_t{0});

    REQUIRE(path.last_key() == "items");
    REQUIRE_FALSE(path.ends_with_key("items"));

    path.pop_back();
    REQUIRE(path.ends_with_key("items"));
    REQUIRE(path == ChangePath{"items"});
}

TEST_CASE("path_to_string", "[path]") {
    Path path{std::string{"users"}, std::size_t{0}, std::string{"name"}};
    REQUIRE(path_to_string(path) == "root.users[0].name");
    REQUIRE(path_to_string(Path{}) == "root");
}
