#include "xdgbase/core/config.hpp"
#include "xdgbase/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace xdgbase {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        if (config.output != "text" && config.output != "json") {
            LOG_WARN("Config: unknown output format '{}', using text", config.output);
            config.output = "text";
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("XDGBASE_LOG_LEVEL"); val && *val) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("XDGBASE_OUTPUT"); val && *val) {
        config.output = (std::string(val) == "json") ? "json" : "text";
    }
    if (auto* val = std::getenv("XDGBASE_ENV_FILE"); val && *val) {
        config.env_file = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto merge_config(Config base, const Config& overrides) -> Config {
    const Config defaults;

    if (overrides.log_level != defaults.log_level) {
        base.log_level = overrides.log_level;
    }
    if (overrides.output != defaults.output) {
        base.output = overrides.output;
    }
    if (overrides.env_file) {
        base.env_file = overrides.env_file;
    }
    if (overrides.environment) {
        if (!base.environment) base.environment.emplace();
        for (const auto& [key, value] : *overrides.environment) {
            (*base.environment)[key] = value;
        }
    }
    return base;
}

} // namespace xdgbase
