#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "xdgbase/infra/path_containment.hpp"

using namespace xdgbase::infra;
namespace fs = std::filesystem;

TEST_CASE("is_within accepts the base and its descendants", "[infra][path_containment]") {
    CHECK(is_within("/home/user", "/home/user"));
    CHECK(is_within("/home/user", "/home/user/"));
    CHECK(is_within("/home/user/", "/home/user"));
    CHECK(is_within("/home/user", "/home/user/a/b"));
    CHECK(is_within("/home/user", "/home/user/a/../b"));
    CHECK(is_within("/home/user", "/home/user/./a"));
    CHECK(is_within("/", "/anything"));
}

TEST_CASE("is_within rejects paths outside the base", "[infra][path_containment]") {
    CHECK_FALSE(is_within("/home/user", "/home"));
    CHECK_FALSE(is_within("/home/user", "/home/username"));
    CHECK_FALSE(is_within("/home/user", "/home/user/.."));
    CHECK_FALSE(is_within("/home/user", "/home/user/a/../../other"));
    CHECK_FALSE(is_within("/home", "/"));
    CHECK_FALSE(is_within("/home", "relative"));
}

TEST_CASE("is_within with relative bases", "[infra][path_containment]") {
    CHECK(is_within("data", "data/app"));
    CHECK_FALSE(is_within("data", "other/app"));
    CHECK(is_within(".", "app"));
    CHECK_FALSE(is_within(".", "../app"));
    CHECK_FALSE(is_within(".", "/app"));
}

TEST_CASE("is_within treats an empty base as the current directory", "[infra][path_containment]") {
    CHECK(is_within(fs::path(), "app"));
    CHECK(is_within(fs::path(), fs::path()));
    CHECK_FALSE(is_within(fs::path(), ".."));
    CHECK_FALSE(is_within(fs::path(), "../esc"));
    CHECK_FALSE(is_within(fs::path(), "/app"));

    auto climbing = join_within(fs::path(), "../esc");
    REQUIRE_FALSE(climbing.has_value());
    CHECK(climbing.error().code() == xdgbase::ErrorCode::PathEscape);
}

TEST_CASE("join_within returns the plain join", "[infra][path_containment]") {
    auto joined = join_within("/base", "a/b");
    REQUIRE(joined.has_value());
    CHECK(*joined == fs::path("/base/a/b"));

    auto same = join_within("/base", fs::path());
    REQUIRE(same.has_value());
    CHECK(*same == fs::path("/base"));
}

TEST_CASE("join_within reports escapes", "[infra][path_containment]") {
    auto absolute = join_within("/home", "/");
    REQUIRE_FALSE(absolute.has_value());
    CHECK(absolute.error().code() == xdgbase::ErrorCode::PathEscape);
    CHECK(absolute.error().detail() == "'/' is not within '/home'");

    auto climbing = join_within("/home/user", "../other");
    REQUIRE_FALSE(climbing.has_value());
    CHECK(climbing.error().code() == xdgbase::ErrorCode::PathEscape);
}
