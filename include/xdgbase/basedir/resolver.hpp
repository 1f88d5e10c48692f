#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "xdgbase/basedir/path_sequence.hpp"
#include "xdgbase/core/error.hpp"
#include "xdgbase/infra/environment.hpp"

namespace xdgbase::basedir {

/// Separator between entries of a list variable such as XDG_DATA_DIRS.
inline constexpr char kPathListSeparator = ':';

/// Builds a path from a string the way a POSIX path library would:
/// repeated and trailing separators and "." elements are dropped
/// ("/usr//./share/" -> "/usr/share"). The root stays "/", and a value made
/// only of "." elements becomes ".". ".." is kept.
auto to_path(std::string_view value) -> std::filesystem::path;

/// Resolves a single path.
///
/// Returns the value of `variable` in `env` if it is set and non-empty,
/// otherwise `fallback` if it is given and non-empty.
/// Fails with ErrorCode::MissingConfiguration if neither is usable.
/// Does not check that the path exists or is absolute.
auto get_path(const infra::Environment& env,
              std::optional<std::string_view> variable,
              std::optional<std::filesystem::path> fallback = std::nullopt)
    -> Result<std::filesystem::path>;

/// Resolves a colon-separated list of paths.
///
/// The list is taken from `variable` if it is set and non-empty, otherwise
/// from `fallback_spec`; if neither is non-empty this fails immediately with
/// ErrorCode::MissingConfiguration. The returned sequence yields one path per
/// segment, in order. An empty segment ("a::b", "a:") yields a
/// MissingConfiguration error and ends the sequence.
auto gen_paths(const infra::Environment& env,
               std::string_view variable,
               std::optional<std::string_view> fallback_spec = std::nullopt)
    -> Result<PathSequence>;

} // namespace xdgbase::basedir
