#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include <nlohmann/json_fwd.hpp>

#include "xdgbase/core/error.hpp"
#include "xdgbase/infra/environment.hpp"

namespace xdgbase::basedir {

inline constexpr std::string_view kHomeVar = "HOME";
inline constexpr std::string_view kDataHomeVar = "XDG_DATA_HOME";
inline constexpr std::string_view kConfigHomeVar = "XDG_CONFIG_HOME";
inline constexpr std::string_view kStateHomeVar = "XDG_STATE_HOME";
inline constexpr std::string_view kCacheHomeVar = "XDG_CACHE_HOME";
inline constexpr std::string_view kDataDirsVar = "XDG_DATA_DIRS";
inline constexpr std::string_view kConfigDirsVar = "XDG_CONFIG_DIRS";
inline constexpr std::string_view kRuntimeDirVar = "XDG_RUNTIME_DIR";

inline constexpr std::string_view kDefaultDataDirs = "/usr/local/share/:/usr/share/";
inline constexpr std::string_view kDefaultConfigDirs = "/etc/xdg";

/// Resolved base directories.
///
/// Produced once by initialize_standard_locations() and treated as a
/// read-only value afterwards; the owner decides how long it lives.
struct StandardLocations {
    std::filesystem::path home;
    std::filesystem::path data_home;
    std::filesystem::path config_home;
    std::filesystem::path state_home;
    std::filesystem::path cache_home;
    std::vector<std::filesystem::path> data_dirs;    // descending priority
    std::vector<std::filesystem::path> config_dirs;  // descending priority
    std::filesystem::path runtime_dir;

    /// True when XDG_RUNTIME_DIR was not set and /tmp/user-<uid> was used.
    /// That directory carries none of the ownership, permission or lifetime
    /// guarantees of a real runtime directory; callers that rely on them
    /// must check for themselves.
    bool runtime_dir_is_fallback = false;
};

void to_json(nlohmann::json& j, const StandardLocations& locations);

/// The user's home directory: HOME if non-empty, otherwise the password
/// database entry of the current user.
auto resolve_home(const infra::Environment& env) -> Result<std::filesystem::path>;

/// "/tmp/user-<uid>", used when XDG_RUNTIME_DIR is not set.
auto fallback_runtime_dir(uid_t uid) -> std::filesystem::path;

/// Resolves every base directory from `env`.
/// Any resolution failure is returned as-is.
auto initialize_standard_locations(const infra::Environment& env)
    -> Result<StandardLocations>;

} // namespace xdgbase::basedir
