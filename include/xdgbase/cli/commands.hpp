#pragma once

#include <functional>
#include <utility>

#include <CLI/CLI.hpp>

#include "xdgbase/basedir/locations.hpp"
#include "xdgbase/core/config.hpp"
#include "xdgbase/infra/environment.hpp"

// Version string; typically injected by CMake via -DXDGBASE_VERSION_STRING=...
#ifndef XDGBASE_VERSION_STRING
#define XDGBASE_VERSION_STRING "0.1.0-dev"
#endif

namespace xdgbase::cli {

/// Process exit codes of xdg-basedir.
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitNotFound = 2;

/// Everything a subcommand needs once arguments and configuration are settled.
struct CommandContext {
    Config config;
    infra::Environment environment;
    basedir::StandardLocations locations;
};

/// A registered subcommand. Runs after parsing; returns the exit code.
struct Command {
    std::function<int(const CommandContext&)> run;
    bool needs_locations = true;
};

/// Register the `show` subcommand.
/// Prints every resolved location, or the search list of one category.
auto register_show_command(CLI::App& app) -> std::pair<CLI::App*, Command>;

/// Register the `ensure` subcommand.
/// Creates a directory under a category's per-user location.
auto register_ensure_command(CLI::App& app) -> std::pair<CLI::App*, Command>;

/// Register the `find` subcommand.
/// Lists existing occurrences of a sub-path in a category's search list.
auto register_find_command(CLI::App& app) -> std::pair<CLI::App*, Command>;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> std::pair<CLI::App*, Command>;

} // namespace xdgbase::cli
