#pragma once

#include <map>
#include <string>

#include <CLI/CLI.hpp>

#include "xdgbase/cli/commands.hpp"
#include "xdgbase/core/config.hpp"
#include "xdgbase/core/error.hpp"

namespace xdgbase::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, settles the configuration
/// (defaults, XDGBASE_* variables, config file, flags), takes the
/// environment snapshot and dispatches to the selected subcommand.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() const -> const Config&;

    /// Environment snapshot for the current configuration: the process
    /// environment, then the env file, then the config's overrides.
    [[nodiscard]] auto build_environment(const infra::Environment& process) const
        -> Result<infra::Environment>;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Merge the config file and flags into config_.
    void resolve_config();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::string env_file_;
    std::map<const CLI::App*, Command> commands_;
};

} // namespace xdgbase::cli
