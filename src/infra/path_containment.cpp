#include "xdgbase/infra/path_containment.hpp"

#include <algorithm>

namespace xdgbase::infra {

namespace fs = std::filesystem;

namespace {

// lexically_normal() leaves a trailing empty element for "a/b/"; drop it so
// that "/base/" and "/base" compare equal. An empty path is the current
// directory.
auto normalized(const fs::path& path) -> fs::path {
    auto normal = path.lexically_normal();
    if (normal.empty()) {
        return fs::path(".");
    }
    if (normal.filename().empty() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // anonymous namespace

auto is_within(const fs::path& base, const fs::path& candidate) -> bool {
    auto normal_base = normalized(base);
    auto normal_candidate = normalized(candidate);

    if (normal_base.is_absolute() != normal_candidate.is_absolute()) {
        return false;
    }

    // Relative base "." contains every relative path that does not climb out.
    if (normal_base == ".") {
        return normal_candidate.empty() || *normal_candidate.begin() != "..";
    }

    auto mismatch = std::mismatch(normal_base.begin(), normal_base.end(),
                                  normal_candidate.begin(), normal_candidate.end());
    return mismatch.first == normal_base.end();
}

auto join_within(const fs::path& base, const fs::path& sub) -> Result<fs::path> {
    auto joined = sub.empty() ? base : base / sub;
    if (!is_within(base, joined)) {
        return std::unexpected(make_error(ErrorCode::PathEscape,
            "Path escapes its base directory",
            "'" + joined.string() + "' is not within '" + base.string() + "'"));
    }
    return joined;
}

} // namespace xdgbase::infra
