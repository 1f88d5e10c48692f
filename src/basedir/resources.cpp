#include "xdgbase/basedir/resources.hpp"

#include "xdgbase/infra/path_containment.hpp"

#include <string>
#include <system_error>

namespace xdgbase::basedir {

namespace fs = std::filesystem;

auto category_name(Category category) -> std::string_view {
    switch (category) {
        case Category::Data: return "data";
        case Category::Config: return "config";
        case Category::State: return "state";
        case Category::Cache: return "cache";
        case Category::Runtime: return "runtime";
        default: return "unknown";
    }
}

auto parse_category(std::string_view name) -> Result<Category> {
    for (auto category : {Category::Data, Category::Config, Category::State,
                          Category::Cache, Category::Runtime}) {
        if (category_name(category) == name) return category;
    }
    return std::unexpected(make_error(ErrorCode::InvalidArgument,
        "Unknown directory category", std::string(name)));
}

auto home_path(const StandardLocations& locations, Category category)
    -> const fs::path& {
    switch (category) {
        case Category::Data: return locations.data_home;
        case Category::Config: return locations.config_home;
        case Category::State: return locations.state_home;
        case Category::Cache: return locations.cache_home;
        case Category::Runtime: return locations.runtime_dir;
    }
    return locations.data_home;
}

auto search_paths(const StandardLocations& locations, Category category)
    -> std::vector<fs::path> {
    std::vector<fs::path> paths{home_path(locations, category)};
    if (category == Category::Data) {
        paths.insert(paths.end(), locations.data_dirs.begin(), locations.data_dirs.end());
    } else if (category == Category::Config) {
        paths.insert(paths.end(), locations.config_dirs.begin(), locations.config_dirs.end());
    }
    return paths;
}

auto join_components(const std::vector<fs::path>& sub_paths) -> fs::path {
    fs::path joined;
    for (const auto& component : sub_paths) {
        for (const auto& element : component) {
            if (element.empty() || element == ".") continue;
            joined /= element;
        }
    }
    return joined;
}

auto ensure_resource(const fs::path& base, const std::vector<fs::path>& sub_paths)
    -> Result<fs::path> {
    auto path = infra::join_within(base, join_components(sub_paths));
    if (!path) {
        return path;
    }

    std::error_code ec;
    fs::create_directories(*path, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::FilesystemError,
            "Failed to create directory", path->string(), ec));
    }
    return path;
}

auto ensure_data_resource(const StandardLocations& locations,
                          const std::vector<fs::path>& sub_paths) -> Result<fs::path> {
    return ensure_resource(locations.data_home, sub_paths);
}

auto ensure_config_resource(const StandardLocations& locations,
                            const std::vector<fs::path>& sub_paths) -> Result<fs::path> {
    return ensure_resource(locations.config_home, sub_paths);
}

auto ensure_state_resource(const StandardLocations& locations,
                           const std::vector<fs::path>& sub_paths) -> Result<fs::path> {
    return ensure_resource(locations.state_home, sub_paths);
}

auto ensure_cache_resource(const StandardLocations& locations,
                           const std::vector<fs::path>& sub_paths) -> Result<fs::path> {
    return ensure_resource(locations.cache_home, sub_paths);
}

auto find_resource(std::vector<fs::path> base_paths, const std::vector<fs::path>& sub_paths)
    -> PathSequence {
    return PathSequence(
        [base_paths = std::move(base_paths), sub_path = join_components(sub_paths),
         index = std::size_t{0}]() mutable -> std::optional<PathSequence::value_type> {
            while (index < base_paths.size()) {
                const auto& base = base_paths[index++];

                auto path = infra::join_within(base, sub_path);
                if (!path) return path;

                std::error_code ec;
                if (fs::exists(*path, ec)) return path;
                if (ec) {
                    return std::unexpected(make_error(ErrorCode::FilesystemError,
                        "Failed to check whether path exists", path->string(), ec));
                }
            }
            return std::nullopt;
        });
}

auto find_data_resource(const StandardLocations& locations,
                        const std::vector<fs::path>& sub_paths) -> PathSequence {
    return find_resource(search_paths(locations, Category::Data), sub_paths);
}

auto find_config_resource(const StandardLocations& locations,
                          const std::vector<fs::path>& sub_paths) -> PathSequence {
    return find_resource(search_paths(locations, Category::Config), sub_paths);
}

} // namespace xdgbase::basedir
