#include "xdgbase/basedir/resolver.hpp"

#include <string>

namespace xdgbase::basedir {

namespace fs = std::filesystem;

namespace {

// List segments go through get_path() without a variable, so nothing is read
// from here; it only keeps the sequence independent of the caller's snapshot.
const infra::Environment kNoEnvironment;

} // anonymous namespace

auto to_path(std::string_view value) -> fs::path {
    fs::path path;
    for (const auto& element : fs::path(value)) {
        // Repeated and trailing separators show up as empty elements.
        if (element.empty() || element == ".") continue;
        path /= element;
    }
    if (path.empty() && !value.empty()) {
        return fs::path(".");
    }
    return path;
}

auto get_path(const infra::Environment& env,
              std::optional<std::string_view> variable,
              std::optional<fs::path> fallback) -> Result<fs::path> {
    if (variable) {
        if (auto value = env.get_non_empty(*variable)) {
            return to_path(*value);
        }
    }

    if (fallback && !fallback->empty()) {
        return std::move(*fallback);
    }

    return std::unexpected(make_error(ErrorCode::MissingConfiguration,
        "Neither the environment variable nor the fallback path are valid",
        variable ? std::string(*variable) : std::string("<no variable>")));
}

auto gen_paths(const infra::Environment& env,
               std::string_view variable,
               std::optional<std::string_view> fallback_spec) -> Result<PathSequence> {
    std::string spec;
    if (auto value = env.get_non_empty(variable)) {
        spec = std::move(*value);
    } else if (fallback_spec && !fallback_spec->empty()) {
        spec = std::string(*fallback_spec);
    } else {
        return std::unexpected(make_error(ErrorCode::MissingConfiguration,
            "Neither the environment variable nor the fallback paths are valid",
            std::string(variable)));
    }

    // One element per ':'-separated segment; n separators give n + 1
    // segments, empty ones included.
    return PathSequence(
        [spec = std::move(spec), pos = std::size_t{0}, finished = false]() mutable
            -> std::optional<PathSequence::value_type> {
            if (finished) return std::nullopt;

            auto sep = spec.find(kPathListSeparator, pos);
            std::string_view segment(spec);
            if (sep == std::string::npos) {
                segment = segment.substr(pos);
                finished = true;
            } else {
                segment = segment.substr(pos, sep - pos);
                pos = sep + 1;
            }
            return get_path(kNoEnvironment, std::nullopt, to_path(segment));
        });
}

} // namespace xdgbase::basedir
