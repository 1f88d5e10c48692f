#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "xdgbase/cli/app.hpp"

namespace fs = std::filesystem;

namespace {

auto run_app(xdgbase::cli::App& app, std::vector<std::string> args) -> int {
    args.insert(args.begin(), "xdg-basedir");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return app.run(static_cast<int>(argv.size()), argv.data());
}

auto scratch_dir(const std::string& name) -> fs::path {
    auto dir = fs::temp_directory_path() / ("xdgbase_test_cli_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // anonymous namespace

TEST_CASE("xdg-basedir show succeeds", "[cli]") {
    xdgbase::cli::App app;
    CHECK(run_app(app, {"--log-level", "error", "show"}) == xdgbase::cli::kExitOk);
}

TEST_CASE("xdg-basedir version does not need locations", "[cli]") {
    xdgbase::cli::App app;
    CHECK(run_app(app, {"version"}) == xdgbase::cli::kExitOk);
}

TEST_CASE("xdg-basedir ensure and find a data resource", "[cli]") {
    auto dir = scratch_dir("ensure");
    ::setenv("XDG_DATA_HOME", (dir / "data").c_str(), 1);
    ::setenv("XDG_DATA_DIRS", (dir / "system").c_str(), 1);

    {
        xdgbase::cli::App app;
        CHECK(run_app(app, {"--log-level", "error", "ensure", "data", "app", "db"})
              == xdgbase::cli::kExitOk);
        CHECK(fs::is_directory(dir / "data" / "app" / "db"));
    }

    {
        xdgbase::cli::App app;
        CHECK(run_app(app, {"--log-level", "error", "find", "data", "app", "--first"})
              == xdgbase::cli::kExitOk);
    }

    {
        xdgbase::cli::App app;
        CHECK(run_app(app, {"--log-level", "error", "find", "data", "missing"})
              == xdgbase::cli::kExitNotFound);
    }

    ::unsetenv("XDG_DATA_HOME");
    ::unsetenv("XDG_DATA_DIRS");
    fs::remove_all(dir);
}

TEST_CASE("xdg-basedir ensure reports escapes", "[cli]") {
    auto dir = scratch_dir("escape");
    ::setenv("XDG_CACHE_HOME", (dir / "cache").c_str(), 1);

    xdgbase::cli::App app;
    CHECK(run_app(app, {"--log-level", "critical", "ensure", "cache", "../outside"})
          == xdgbase::cli::kExitError);
    CHECK_FALSE(fs::exists(dir / "outside"));

    ::unsetenv("XDG_CACHE_HOME");
    fs::remove_all(dir);
}

TEST_CASE("xdg-basedir rejects ensure on the runtime directory", "[cli]") {
    xdgbase::cli::App app;
    CHECK(run_app(app, {"ensure", "runtime", "sock"}) != xdgbase::cli::kExitOk);
}

TEST_CASE("xdg-basedir fails on a malformed list variable", "[cli]") {
    ::setenv("XDG_CONFIG_DIRS", "/etc/xdg::/opt", 1);

    xdgbase::cli::App app;
    CHECK(run_app(app, {"--log-level", "critical", "show"}) == xdgbase::cli::kExitError);

    ::unsetenv("XDG_CONFIG_DIRS");
}

TEST_CASE("App::build_environment layers env file and config overrides", "[cli]") {
    auto dir = scratch_dir("environment");
    auto env_file = dir / "base.env";
    {
        std::ofstream out(env_file);
        out << "XDG_STATE_HOME=/file/state\nXDG_CACHE_HOME=/file/cache\n";
    }
    auto config_file = dir / "config.json";
    {
        std::ofstream out(config_file);
        out << R"({"log_level": "error", "environment": {"XDG_CACHE_HOME": "/config/cache"}})";
    }

    xdgbase::cli::App app;
    REQUIRE(run_app(app, {"-c", config_file.string(), "--env-file", env_file.string(),
                          "version"}) == xdgbase::cli::kExitOk);
    CHECK(app.config().log_level == "error");
    REQUIRE(app.config().env_file.has_value());

    xdgbase::infra::Environment process({{"XDG_STATE_HOME", "/process/state"}});
    auto env = app.build_environment(process);
    REQUIRE(env.has_value());
    // The process environment wins over the file; config overrides win over both.
    CHECK(env->get("XDG_STATE_HOME") == "/process/state");
    CHECK(env->get("XDG_CACHE_HOME") == "/config/cache");

    fs::remove_all(dir);
}
