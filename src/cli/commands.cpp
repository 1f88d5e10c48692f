#include "xdgbase/cli/commands.hpp"
#include "xdgbase/basedir/resources.hpp"
#include "xdgbase/core/logger.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace xdgbase::cli {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

auto to_components(const std::vector<std::string>& parts) -> std::vector<fs::path> {
    return std::vector<fs::path>(parts.begin(), parts.end());
}

auto wants_json(const CommandContext& context, bool json_flag) -> bool {
    return json_flag || context.config.output == "json";
}

auto print_paths(const std::vector<fs::path>& paths, bool as_json) -> void {
    if (as_json) {
        json j = json::array();
        for (const auto& path : paths) j.push_back(path.string());
        std::cout << j.dump(2) << "\n";
        return;
    }
    for (const auto& path : paths) {
        std::cout << path.string() << "\n";
    }
}

auto join_list(const std::vector<fs::path>& paths) -> std::string {
    std::string joined;
    for (const auto& path : paths) {
        if (!joined.empty()) joined += ':';
        joined += path.string();
    }
    return joined;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// show command
// ---------------------------------------------------------------------------

auto register_show_command(CLI::App& app) -> std::pair<CLI::App*, Command> {
    struct Options {
        bool json = false;
        std::string category;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("show", "Print the resolved base directories");
    sub->add_flag("--json", opts->json, "Print as JSON");
    sub->add_option("category", opts->category,
                    "Only print the search list of this category "
                    "(data, config, state, cache, runtime)");

    Command command;
    command.run = [opts](const CommandContext& context) -> int {
        const auto& locations = context.locations;
        auto as_json = wants_json(context, opts->json);

        if (!opts->category.empty()) {
            auto category = basedir::parse_category(opts->category);
            if (!category) {
                LOG_ERROR("{}", category.error().what());
                return kExitError;
            }
            print_paths(basedir::search_paths(locations, *category), as_json);
            return kExitOk;
        }

        if (as_json) {
            json j = locations;
            std::cout << j.dump(2) << "\n";
            return kExitOk;
        }

        std::cout << "HOME=" << locations.home.string() << "\n"
                  << "XDG_DATA_HOME=" << locations.data_home.string() << "\n"
                  << "XDG_CONFIG_HOME=" << locations.config_home.string() << "\n"
                  << "XDG_STATE_HOME=" << locations.state_home.string() << "\n"
                  << "XDG_CACHE_HOME=" << locations.cache_home.string() << "\n"
                  << "XDG_DATA_DIRS=" << join_list(locations.data_dirs) << "\n"
                  << "XDG_CONFIG_DIRS=" << join_list(locations.config_dirs) << "\n"
                  << "XDG_RUNTIME_DIR=" << locations.runtime_dir.string();
        if (locations.runtime_dir_is_fallback) {
            std::cout << "  # fallback, not a managed runtime directory";
        }
        std::cout << "\n";
        return kExitOk;
    };
    return {sub, std::move(command)};
}

// ---------------------------------------------------------------------------
// ensure command
// ---------------------------------------------------------------------------

auto register_ensure_command(CLI::App& app) -> std::pair<CLI::App*, Command> {
    struct Options {
        std::string category;
        std::vector<std::string> parts;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("ensure",
        "Create a directory under a category's per-user location and print it");
    sub->add_option("category", opts->category, "data, config, state or cache")
        ->required()
        ->check(CLI::IsMember({"data", "config", "state", "cache"}));
    sub->add_option("components", opts->parts, "Sub-path components")
        ->required();

    Command command;
    command.run = [opts](const CommandContext& context) -> int {
        auto category = basedir::parse_category(opts->category);
        if (!category) {
            LOG_ERROR("{}", category.error().what());
            return kExitError;
        }

        auto components = to_components(opts->parts);
        Result<fs::path> path = std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Category does not support ensure", opts->category));
        switch (*category) {
            case basedir::Category::Data:
                path = basedir::ensure_data_resource(context.locations, components);
                break;
            case basedir::Category::Config:
                path = basedir::ensure_config_resource(context.locations, components);
                break;
            case basedir::Category::State:
                path = basedir::ensure_state_resource(context.locations, components);
                break;
            case basedir::Category::Cache:
                path = basedir::ensure_cache_resource(context.locations, components);
                break;
            default:
                break;
        }

        if (!path) {
            LOG_ERROR("[{}] {}", error_code_to_string(path.error().code()),
                      path.error().what());
            return kExitError;
        }
        LOG_DEBUG("Ensured {}", path->string());
        std::cout << path->string() << "\n";
        return kExitOk;
    };
    return {sub, std::move(command)};
}

// ---------------------------------------------------------------------------
// find command
// ---------------------------------------------------------------------------

auto register_find_command(CLI::App& app) -> std::pair<CLI::App*, Command> {
    struct Options {
        std::string category;
        std::vector<std::string> parts;
        bool first = false;
        bool json = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("find",
        "List existing occurrences of a sub-path, highest priority first");
    sub->add_option("category", opts->category, "data, config, state, cache or runtime")
        ->required()
        ->check(CLI::IsMember({"data", "config", "state", "cache", "runtime"}));
    sub->add_option("components", opts->parts, "Sub-path components");
    sub->add_flag("--first", opts->first, "Only print the highest-priority match");
    sub->add_flag("--json", opts->json, "Print as JSON");

    Command command;
    command.run = [opts](const CommandContext& context) -> int {
        auto category = basedir::parse_category(opts->category);
        if (!category) {
            LOG_ERROR("{}", category.error().what());
            return kExitError;
        }

        auto components = to_components(opts->parts);
        auto matches = [&]() {
            switch (*category) {
                case basedir::Category::Data:
                    return basedir::find_data_resource(context.locations, components);
                case basedir::Category::Config:
                    return basedir::find_config_resource(context.locations, components);
                default:
                    return basedir::find_resource(
                        basedir::search_paths(context.locations, *category), components);
            }
        }();

        std::vector<fs::path> found;
        for (const auto& match : matches) {
            if (!match) {
                print_paths(found, wants_json(context, opts->json));
                LOG_ERROR("[{}] {}", error_code_to_string(match.error().code()),
                          match.error().what());
                return kExitError;
            }
            found.push_back(*match);
            if (opts->first) break;
        }

        print_paths(found, wants_json(context, opts->json));
        if (found.empty()) {
            LOG_INFO("No {} resource named '{}'", opts->category,
                     basedir::join_components(components).string());
            return kExitNotFound;
        }
        return kExitOk;
    };
    return {sub, std::move(command)};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> std::pair<CLI::App*, Command> {
    auto* sub = app.add_subcommand("version", "Print version information");

    Command command;
    command.needs_locations = false;
    command.run = [](const CommandContext&) -> int {
        std::cout << "xdg-basedir " << XDGBASE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other POSIX\n";
#endif
        return kExitOk;
    };
    return {sub, std::move(command)};
}

} // namespace xdgbase::cli
