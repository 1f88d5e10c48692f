#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "xdgbase/basedir/locations.hpp"
#include "xdgbase/basedir/path_sequence.hpp"
#include "xdgbase/core/error.hpp"

namespace xdgbase::basedir {

enum class Category {
    Data,
    Config,
    State,
    Cache,
    Runtime,
};

auto category_name(Category category) -> std::string_view;

/// Parses "data", "config", "state", "cache" or "runtime".
auto parse_category(std::string_view name) -> Result<Category>;

/// The per-user directory of `category`; the target of ensure operations.
auto home_path(const StandardLocations& locations, Category category)
    -> const std::filesystem::path&;

/// Directories searched by find operations, in descending priority:
/// the per-user directory followed by the system directories, if any.
auto search_paths(const StandardLocations& locations, Category category)
    -> std::vector<std::filesystem::path>;

/// Joins path components; components may contain separators. Empty
/// components and "." elements are skipped.
auto join_components(const std::vector<std::filesystem::path>& sub_paths)
    -> std::filesystem::path;

/// Ensures that directory `base`/`sub_paths`... exists and returns it.
///
/// Missing parents are created; an existing directory is not an error.
/// Fails with ErrorCode::PathEscape if the joined path is not inside `base`,
/// or ErrorCode::FilesystemError (with the OS error as cause) if the
/// directory cannot be created.
auto ensure_resource(const std::filesystem::path& base,
                     const std::vector<std::filesystem::path>& sub_paths)
    -> Result<std::filesystem::path>;

auto ensure_data_resource(const StandardLocations& locations,
                          const std::vector<std::filesystem::path>& sub_paths)
    -> Result<std::filesystem::path>;
auto ensure_config_resource(const StandardLocations& locations,
                            const std::vector<std::filesystem::path>& sub_paths)
    -> Result<std::filesystem::path>;
auto ensure_state_resource(const StandardLocations& locations,
                           const std::vector<std::filesystem::path>& sub_paths)
    -> Result<std::filesystem::path>;
auto ensure_cache_resource(const StandardLocations& locations,
                           const std::vector<std::filesystem::path>& sub_paths)
    -> Result<std::filesystem::path>;

/// Lazily yields `base`/`sub_paths`... for every base in `base_paths` where
/// that path currently exists, in the order of `base_paths`.
///
/// Existence is checked when an element is pulled. A base the sub-path would
/// escape yields an ErrorCode::PathEscape error and ends the sequence.
auto find_resource(std::vector<std::filesystem::path> base_paths,
                   const std::vector<std::filesystem::path>& sub_paths) -> PathSequence;

/// Searches data_home, then data_dirs.
auto find_data_resource(const StandardLocations& locations,
                        const std::vector<std::filesystem::path>& sub_paths) -> PathSequence;

/// Searches config_home, then config_dirs.
auto find_config_resource(const StandardLocations& locations,
                          const std::vector<std::filesystem::path>& sub_paths) -> PathSequence;

} // namespace xdgbase::basedir
