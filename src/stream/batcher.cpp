#include "batcher.hpp"

namespace chunkflow {

ContentBatcher::ContentBatcher(const StreamConfig& config)
    : size_threshold_(config.batch_size_threshold)
    , time_threshold_ms_(static_cast<double>(config.batch_time_threshold_ms))
    , isolation_ms_(config.batch_isolation_factor *
                    static_cast<double>(config.batch_time_threshold_ms))
{}

bool ContentBatcher::should_batch(size_t length, TimePoint now) const {
    if (length >= size_threshold_) return false;
    if (!last_arrival_) return false;
    return elapsed_ms(*last_arrival_, now) <= isolation_ms_;
}

bool ContentBatcher::should_flush(TimePoint now) const {
    if (pending_.empty()) return false;
    if (pending_bytes_ >= size_threshold_) return true;
    return elapsed_ms(opened_at_, now) >= time_threshold_ms_;
}

void ContentBatcher::add(std::string fragment, TimePoint now) {
    if (pending_.empty()) opened_at_ = now;
    pending_bytes_ += fragment.size();
    pending_.push_back(std::move(fragment));
}

std::string ContentBatcher::flush() {
    std::string joined;
    joined.reserve(pending_bytes_);
    for (const auto& p : pending_) joined += p;
    pending_.clear();
    pending_bytes_ = 0;
    return joined;
}

void ContentBatcher::reset() {
    pending_.clear();
    pending_bytes_ = 0;
    last_arrival_.reset();
}

} // namespace chunkflow
