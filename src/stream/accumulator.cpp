#include "accumulator.hpp"

namespace chunkflow {

void ContentAccumulator::append_sanitized(std::string fragment) {
    if (fragment.empty()) return;
    parts_.push_back(std::move(fragment));
    dirty_ = true;
}

const std::string& ContentAccumulator::sanitized() const {
    if (dirty_) {
        size_t total = 0;
        for (const auto& p : parts_) total += p.size();
        joined_.clear();
        joined_.reserve(total);
        for (const auto& p : parts_) joined_ += p;
        dirty_ = false;
    }
    return joined_;
}

void ContentAccumulator::clear() {
    raw_.clear();
    parts_.clear();
    joined_.clear();
    dirty_ = false;
}

} // namespace chunkflow
