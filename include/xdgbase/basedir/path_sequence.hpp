#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <optional>
#include <vector>

#include "xdgbase/core/error.hpp"

namespace xdgbase::basedir {

/// Lazy, single-pass sequence of paths.
///
/// Elements are produced on demand by a producer callback. An element is
/// either a path or an error; once an error has been produced the sequence
/// is exhausted, so later elements are never computed. To iterate again,
/// call the function that created the sequence again.
class PathSequence {
public:
    using value_type = Result<std::filesystem::path>;

    /// Returns the next element, or std::nullopt when the source is exhausted.
    using Producer = std::function<std::optional<value_type>()>;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PathSequence::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        Iterator() = default;
        explicit Iterator(PathSequence* sequence);

        auto operator*() const -> reference { return *current_; }
        auto operator->() const -> pointer { return &*current_; }
        auto operator++() -> Iterator&;
        void operator++(int) { ++*this; }

        friend auto operator==(const Iterator& lhs, const Iterator& rhs) -> bool {
            return lhs.sequence_ == rhs.sequence_;
        }

    private:
        void advance();

        PathSequence* sequence_ = nullptr;
        std::optional<value_type> current_;
    };

    explicit PathSequence(Producer producer);

    // Iterators point back into the sequence.
    PathSequence(const PathSequence&) = delete;
    PathSequence& operator=(const PathSequence&) = delete;
    PathSequence(PathSequence&&) = default;
    PathSequence& operator=(PathSequence&&) = default;

    /// Pulls the next element. After an error element or the end of the
    /// source, keeps returning std::nullopt.
    auto next() -> std::optional<value_type>;

    [[nodiscard]] auto exhausted() const noexcept -> bool { return done_; }

    auto begin() -> Iterator { return Iterator(this); }
    auto end() -> Iterator { return Iterator(); }

    /// Drains the sequence into a vector, stopping at the first error.
    auto collect() -> Result<std::vector<std::filesystem::path>>;

private:
    Producer producer_;
    bool done_ = false;
};

} // namespace xdgbase::basedir
