#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "xdgbase/infra/dotenv.hpp"

using xdgbase::infra::Environment;
namespace fs = std::filesystem;

static auto write_env_file(const std::string& content) -> fs::path {
    auto tmp = fs::temp_directory_path() / "xdgbase_test_dotenv_file.env";
    std::ofstream out(tmp);
    out << content;
    out.close();
    return tmp;
}

TEST_CASE("dotenv parse basic KEY=VALUE", "[infra][dotenv]") {
    auto path = write_env_file("XDG_DATA_HOME=/data\nXDG_CACHE_HOME=/cache\n");
    auto env = xdgbase::infra::parse(path);

    REQUIRE(env.has_value());
    REQUIRE(env->size() == 2);
    CHECK(env->at("XDG_DATA_HOME") == "/data");
    CHECK(env->at("XDG_CACHE_HOME") == "/cache");

    fs::remove(path);
}

TEST_CASE("dotenv parse quoted values", "[infra][dotenv]") {
    auto path = write_env_file(R"(SPACED="/home/me/My Data")" "\n"
                               R"(ESCAPED="a\tb")" "\n"
                               "LITERAL='/x\\ny'\n");
    auto env = xdgbase::infra::parse(path);

    REQUIRE(env.has_value());
    CHECK(env->at("SPACED") == "/home/me/My Data");
    CHECK(env->at("ESCAPED") == "a\tb");
    // Single-quoted values are literal
    CHECK(env->at("LITERAL") == "/x\\ny");

    fs::remove(path);
}

TEST_CASE("dotenv parse skips comments, blanks and malformed lines", "[infra][dotenv]") {
    auto path = write_env_file(
        "# base directories\n"
        "\n"
        "export XDG_CONFIG_DIRS=/etc/xdg:/opt/xdg # system\n"
        "no_equals_sign\n"
        "=no_key\n"
        "EMPTY=\n"
    );
    auto env = xdgbase::infra::parse(path);

    REQUIRE(env.has_value());
    REQUIRE(env->size() == 2);
    CHECK(env->at("XDG_CONFIG_DIRS") == "/etc/xdg:/opt/xdg");
    CHECK(env->at("EMPTY") == "");

    fs::remove(path);
}

TEST_CASE("dotenv parse fails for a missing file", "[infra][dotenv]") {
    auto env = xdgbase::infra::parse("/nonexistent/path/.env");
    REQUIRE_FALSE(env.has_value());
    CHECK(env.error().code() == xdgbase::ErrorCode::NotFound);
}

TEST_CASE("dotenv load overlays without touching the process", "[infra][dotenv]") {
    auto path = write_env_file("XDG_STATE_HOME=/from/file\nXDG_RUNTIME_DIR=/run/file\n");
    Environment base({{"XDG_RUNTIME_DIR", "/run/base"}});

    SECTION("existing variables win by default") {
        auto env = xdgbase::infra::load(path, base);
        REQUIRE(env.has_value());
        CHECK(env->get("XDG_STATE_HOME") == "/from/file");
        CHECK(env->get("XDG_RUNTIME_DIR") == "/run/base");
    }

    SECTION("overwrite replaces existing variables") {
        auto env = xdgbase::infra::load(path, base, true);
        REQUIRE(env.has_value());
        CHECK(env->get("XDG_RUNTIME_DIR") == "/run/file");
    }

    CHECK(std::getenv("XDG_STATE_HOME") == nullptr ||
          std::string(std::getenv("XDG_STATE_HOME")) != "/from/file");

    fs::remove(path);
}
