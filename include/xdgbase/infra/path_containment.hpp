#pragma once

#include <filesystem>

#include "xdgbase/core/error.hpp"

namespace xdgbase::infra {

/// True if `candidate` is `base` or lies below it.
/// Both paths are compared component-wise after lexical normalization;
/// the filesystem is not consulted, so symlinks are not followed.
auto is_within(const std::filesystem::path& base, const std::filesystem::path& candidate)
    -> bool;

/// Joins `sub` onto `base` and checks that the result stays inside `base`.
/// An absolute `sub` or one that climbs out with ".." fails with
/// ErrorCode::PathEscape. The returned path is the plain join, not normalized.
auto join_within(const std::filesystem::path& base, const std::filesystem::path& sub)
    -> Result<std::filesystem::path>;

} // namespace xdgbase::infra
