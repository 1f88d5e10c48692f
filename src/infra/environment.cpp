#include "xdgbase/infra/environment.hpp"

#include <unistd.h>

extern char** environ;

namespace xdgbase::infra {

Environment::Environment(Variables variables)
    : variables_(std::move(variables)) {}

Environment::Environment(std::initializer_list<Variables::value_type> variables)
    : variables_(variables) {}

auto Environment::capture() -> Environment {
    Variables variables;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view line(*entry);
        auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos || eq_pos == 0) {
            continue;
        }
        // First definition wins, matching getenv().
        variables.emplace(std::string(line.substr(0, eq_pos)),
                          std::string(line.substr(eq_pos + 1)));
    }
    return Environment(std::move(variables));
}

auto Environment::get(std::string_view name) const -> std::optional<std::string> {
    auto it = variables_.find(name);
    if (it == variables_.end()) return std::nullopt;
    return it->second;
}

auto Environment::get_non_empty(std::string_view name) const -> std::optional<std::string> {
    auto value = get(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

auto Environment::contains(std::string_view name) const -> bool {
    return variables_.find(name) != variables_.end();
}

auto Environment::overlay(const Variables& overrides, bool overwrite) const -> Environment {
    auto merged = variables_;
    for (const auto& [key, value] : overrides) {
        if (overwrite) {
            merged.insert_or_assign(key, value);
        } else {
            merged.emplace(key, value);
        }
    }
    return Environment(std::move(merged));
}

} // namespace xdgbase::infra
