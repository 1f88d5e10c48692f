#include "xdgbase/basedir/path_sequence.hpp"

namespace xdgbase::basedir {

PathSequence::PathSequence(Producer producer)
    : producer_(std::move(producer)) {}

auto PathSequence::next() -> std::optional<value_type> {
    if (done_) return std::nullopt;

    auto element = producer_();
    if (!element || !element->has_value()) {
        done_ = true;
    }
    return element;
}

auto PathSequence::collect() -> Result<std::vector<std::filesystem::path>> {
    std::vector<std::filesystem::path> paths;
    while (auto element = next()) {
        if (!element->has_value()) {
            return std::unexpected(std::move(element->error()));
        }
        paths.push_back(std::move(**element));
    }
    return paths;
}

PathSequence::Iterator::Iterator(PathSequence* sequence)
    : sequence_(sequence) {
    advance();
}

auto PathSequence::Iterator::operator++() -> Iterator& {
    advance();
    return *this;
}

void PathSequence::Iterator::advance() {
    if (!sequence_) return;
    current_ = sequence_->next();
    if (!current_) {
        sequence_ = nullptr;
    }
}

} // namespace xdgbase::basedir
