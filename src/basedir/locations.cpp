#include "xdgbase/basedir/locations.hpp"

#include "xdgbase/basedir/resolver.hpp"
#include "xdgbase/core/logger.hpp"

#include <string>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/ranges.h>

namespace xdgbase::basedir {

namespace fs = std::filesystem;

namespace {

auto path_strings(const std::vector<fs::path>& paths) -> std::vector<std::string> {
    std::vector<std::string> strings;
    strings.reserve(paths.size());
    for (const auto& path : paths) {
        strings.push_back(path.string());
    }
    return strings;
}

auto log_source(const infra::Environment& env, std::string_view variable,
                const fs::path& resolved) -> void {
    LOG_DEBUG("{} = {} ({})", variable, resolved.string(),
              env.get_non_empty(variable) ? "environment" : "default");
}

auto resolve_list(const infra::Environment& env, std::string_view variable,
                  std::string_view fallback_spec) -> Result<std::vector<fs::path>> {
    auto sequence = gen_paths(env, variable, fallback_spec);
    if (!sequence) {
        return std::unexpected(std::move(sequence.error()));
    }
    auto paths = sequence->collect();
    if (paths) {
        LOG_DEBUG("{} = [{}] ({})", variable, fmt::join(path_strings(*paths), ", "),
                  env.get_non_empty(variable) ? "environment" : "default");
    }
    return paths;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const StandardLocations& locations) {
    j = nlohmann::json{
        {"home", locations.home.string()},
        {"data_home", locations.data_home.string()},
        {"config_home", locations.config_home.string()},
        {"state_home", locations.state_home.string()},
        {"cache_home", locations.cache_home.string()},
        {"data_dirs", path_strings(locations.data_dirs)},
        {"config_dirs", path_strings(locations.config_dirs)},
        {"runtime_dir", locations.runtime_dir.string()},
        {"runtime_dir_is_fallback", locations.runtime_dir_is_fallback},
    };
}

auto resolve_home(const infra::Environment& env) -> Result<fs::path> {
    if (auto home = env.get_non_empty(kHomeVar)) {
        return to_path(*home);
    }

    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }

    return std::unexpected(make_error(ErrorCode::MissingConfiguration,
        "Could not determine the home directory",
        "HOME is unset and uid " + std::to_string(::getuid()) + " has no passwd entry"));
}

auto fallback_runtime_dir(uid_t uid) -> fs::path {
    return fs::path("/tmp") / ("user-" + std::to_string(uid));
}

auto initialize_standard_locations(const infra::Environment& env)
    -> Result<StandardLocations> {
    StandardLocations locations;

    auto home = resolve_home(env);
    if (!home) return std::unexpected(std::move(home.error()));
    locations.home = std::move(*home);

    struct HomeEntry {
        std::string_view variable;
        fs::path fallback;
        fs::path* target;
    };
    const HomeEntry homes[] = {
        {kDataHomeVar, locations.home / ".local/share", &locations.data_home},
        {kConfigHomeVar, locations.home / ".config", &locations.config_home},
        {kStateHomeVar, locations.home / ".local/state", &locations.state_home},
        {kCacheHomeVar, locations.home / ".cache", &locations.cache_home},
    };
    for (const auto& entry : homes) {
        auto path = get_path(env, entry.variable, entry.fallback);
        if (!path) return std::unexpected(std::move(path.error()));
        log_source(env, entry.variable, *path);
        *entry.target = std::move(*path);
    }

    auto data_dirs = resolve_list(env, kDataDirsVar, kDefaultDataDirs);
    if (!data_dirs) return std::unexpected(std::move(data_dirs.error()));
    locations.data_dirs = std::move(*data_dirs);

    auto config_dirs = resolve_list(env, kConfigDirsVar, kDefaultConfigDirs);
    if (!config_dirs) return std::unexpected(std::move(config_dirs.error()));
    locations.config_dirs = std::move(*config_dirs);

    auto runtime_dir = get_path(env, kRuntimeDirVar, fallback_runtime_dir(::getuid()));
    if (!runtime_dir) return std::unexpected(std::move(runtime_dir.error()));
    locations.runtime_dir = std::move(*runtime_dir);
    locations.runtime_dir_is_fallback = !env.get_non_empty(kRuntimeDirVar).has_value();

    if (locations.runtime_dir_is_fallback) {
        LOG_WARN("{} is not set; falling back to {}, which is not guaranteed to be "
                 "private to this user", kRuntimeDirVar, locations.runtime_dir.string());
    } else {
        log_source(env, kRuntimeDirVar, locations.runtime_dir);
    }

    return locations;
}

} // namespace xdgbase::basedir
