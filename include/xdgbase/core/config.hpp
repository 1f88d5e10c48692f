#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json, needed by the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace xdgbase {

using json = nlohmann::json;

/// Settings of the xdg-basedir tool. The library itself takes no configuration
/// beyond the environment snapshot it is given.
struct Config {
    std::string log_level = "warn";
    std::string output = "text";  // "text", "json"
    std::optional<std::string> env_file;
    // Applied on top of the environment snapshot, after env_file.
    std::optional<std::map<std::string, std::string>> environment;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, output, env_file, environment)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Folds `overrides` into `base`; fields left at their defaults in
/// `overrides` keep the value from `base`.
auto merge_config(Config base, const Config& overrides) -> Config;

} // namespace xdgbase
