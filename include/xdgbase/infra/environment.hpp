#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xdgbase::infra {

/// Immutable snapshot of environment variables.
///
/// Everything that resolves directories reads from a snapshot instead of
/// the live process environment, so a resolution can be repeated against
/// a synthetic environment without touching global state.
class Environment {
public:
    using Variables = std::map<std::string, std::string, std::less<>>;

    Environment() = default;
    explicit Environment(Variables variables);
    Environment(std::initializer_list<Variables::value_type> variables);

    /// Copies the current process environment.
    static auto capture() -> Environment;

    /// Value of `name`, or std::nullopt if it is not defined.
    /// A variable defined with an empty value is returned as "".
    [[nodiscard]] auto get(std::string_view name) const -> std::optional<std::string>;

    /// Value of `name` only if it is defined and non-empty.
    [[nodiscard]] auto get_non_empty(std::string_view name) const -> std::optional<std::string>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return variables_.size(); }
    [[nodiscard]] auto variables() const noexcept -> const Variables& { return variables_; }

    /// Returns a new snapshot with `overrides` applied on top of this one.
    /// Existing values are only replaced when `overwrite` is true.
    [[nodiscard]] auto overlay(const Variables& overrides, bool overwrite = true) const
        -> Environment;

private:
    Variables variables_;
};

} // namespace xdgbase::infra
