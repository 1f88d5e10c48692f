#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "xdgbase/infra/environment.hpp"

using xdgbase::infra::Environment;

TEST_CASE("Environment distinguishes absent and empty variables", "[infra][environment]") {
    Environment env({{"EMPTY", ""}, {"SET", "value"}});

    CHECK_FALSE(env.get("MISSING").has_value());
    CHECK_FALSE(env.contains("MISSING"));

    REQUIRE(env.get("EMPTY").has_value());
    CHECK(env.get("EMPTY")->empty());
    CHECK(env.contains("EMPTY"));
    CHECK_FALSE(env.get_non_empty("EMPTY").has_value());

    CHECK(env.get("SET") == "value");
    CHECK(env.get_non_empty("SET") == "value");
    CHECK(env.size() == 2);
}

TEST_CASE("Environment is constructible from a single braced entry", "[infra][environment]") {
    Environment single({{"HOME", "/"}});
    CHECK(single.get("HOME") == "/");
    CHECK(single.size() == 1);

    Environment from_map(Environment::Variables{{"HOME", "/home/user"}});
    CHECK(from_map.get("HOME") == "/home/user");
}

TEST_CASE("Environment::capture copies the process environment", "[infra][environment]") {
    ::setenv("XDGBASE_TEST_CAPTURE", "captured", 1);
    auto env = Environment::capture();
    ::unsetenv("XDGBASE_TEST_CAPTURE");

    CHECK(env.get("XDGBASE_TEST_CAPTURE") == "captured");
    // Later changes to the process environment are not visible.
    CHECK(env.contains("XDGBASE_TEST_CAPTURE"));
    CHECK_FALSE(Environment::capture().contains("XDGBASE_TEST_CAPTURE"));
}

TEST_CASE("Environment::capture keeps values containing '='", "[infra][environment]") {
    ::setenv("XDGBASE_TEST_EQUALS", "a=b=c", 1);
    auto env = Environment::capture();
    ::unsetenv("XDGBASE_TEST_EQUALS");

    CHECK(env.get("XDGBASE_TEST_EQUALS") == "a=b=c");
}

TEST_CASE("Environment::overlay returns a new snapshot", "[infra][environment]") {
    Environment base({{"A", "1"}, {"B", "2"}});

    SECTION("overwrite") {
        auto merged = base.overlay({{"B", "20"}, {"C", "30"}});
        CHECK(merged.get("A") == "1");
        CHECK(merged.get("B") == "20");
        CHECK(merged.get("C") == "30");
    }

    SECTION("keep existing") {
        auto merged = base.overlay({{"B", "20"}, {"C", "30"}}, false);
        CHECK(merged.get("B") == "2");
        CHECK(merged.get("C") == "30");
    }

    // The original is untouched.
    CHECK(base.get("B") == "2");
    CHECK_FALSE(base.contains("C"));
}
