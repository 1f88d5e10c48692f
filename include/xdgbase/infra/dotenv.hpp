#pragma once

#include <filesystem>

#include "xdgbase/core/error.hpp"
#include "xdgbase/infra/environment.hpp"

namespace xdgbase::infra {

/// Parses a .env file into variable assignments.
/// Supports:
///   - KEY=VALUE
///   - KEY="VALUE" (double-quoted, with escape sequences)
///   - KEY='VALUE' (single-quoted, literal)
///   - # comments (full-line and inline after unquoted values)
///   - Empty lines are skipped
///   - export KEY=VALUE (optional export prefix)
/// Fails with NotFound if the file cannot be opened.
auto parse(const std::filesystem::path& path) -> Result<Environment::Variables>;

/// Returns `base` with the assignments from the .env file at `path` applied.
/// Variables already present in `base` are kept unless `overwrite` is true.
/// The process environment is never modified.
auto load(const std::filesystem::path& path, const Environment& base, bool overwrite = false)
    -> Result<Environment>;

} // namespace xdgbase::infra
