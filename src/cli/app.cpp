#include "xdgbase/cli/app.hpp"
#include "xdgbase/basedir/locations.hpp"
#include "xdgbase/core/logger.hpp"
#include "xdgbase/infra/dotenv.hpp"

#include <filesystem>

namespace xdgbase::cli {

App::App()
    : cli_("xdg-basedir", "Resolve and manage XDG base directories")
{
    cli_.set_version_flag("--version", XDGBASE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("XDGBASE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    // Global option: dotenv file overlaid on the process environment.
    cli_.add_option("--env-file", env_file_,
                    "Read additional environment variables from a .env file")
        ->check(CLI::ExistingFile);

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    resolve_config();

    const CLI::App* selected = cli_.get_subcommands().front();
    auto it = commands_.find(selected);
    if (it == commands_.end()) {
        LOG_ERROR("No handler registered for subcommand '{}'", selected->get_name());
        return kExitError;
    }
    const auto& command = it->second;

    CommandContext context{config_, {}, {}};
    if (command.needs_locations) {
        auto environment = build_environment(infra::Environment::capture());
        if (!environment) {
            LOG_ERROR("{}", environment.error().what());
            return kExitError;
        }
        context.environment = std::move(*environment);

        auto locations = basedir::initialize_standard_locations(context.environment);
        if (!locations) {
            LOG_ERROR("Failed to resolve base directories: {}", locations.error().what());
            return kExitError;
        }
        context.locations = std::move(*locations);
    }

    auto exit_code = command.run(context);
    Logger::flush();
    return exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

auto App::build_environment(const infra::Environment& process) const
    -> Result<infra::Environment> {
    auto environment = process;

    if (config_.env_file) {
        // Variables already exported by the caller win over the file.
        auto loaded = infra::load(std::filesystem::path(*config_.env_file), environment);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        environment = std::move(*loaded);
    }

    if (config_.environment) {
        infra::Environment::Variables overrides(config_.environment->begin(),
                                                config_.environment->end());
        environment = environment.overlay(overrides);
    }

    return environment;
}

void App::setup_commands() {
    for (auto registered : {register_show_command(cli_), register_ensure_command(cli_),
                            register_find_command(cli_), register_version_command(cli_)}) {
        commands_.insert(std::move(registered));
    }
}

void App::resolve_config() {
    auto config = load_config_from_env();
    if (!log_level_.empty()) {
        config.log_level = log_level_;
    }

    // The logger is up before the config file is read so that its warnings show.
    Logger::init("xdg-basedir", config.log_level);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config = merge_config(std::move(config), load_config(std::filesystem::path(config_path_)));
    }

    // Command-line flags take precedence over the file.
    if (!log_level_.empty()) {
        config.log_level = log_level_;
    }
    if (!env_file_.empty()) {
        config.env_file = env_file_;
    }

    Logger::set_level(config.log_level);
    config_ = std::move(config);
}

} // namespace xdgbase::cli
