#include "backpressure.hpp"
#include <algorithm>
#include <iterator>

namespace chunkflow {

BackpressureQueue::BackpressureQueue(size_t max_pending, bool enabled)
    : max_pending_(std::max<size_t>(max_pending, 1)), enabled_(enabled)
{}

std::vector<StreamEvent> BackpressureQueue::admit(std::vector<StreamEvent> events) {
    if (enabled_ && !pressured_ && queue_.size() + events.size() > max_pending_) {
        pressured_ = true;
    }

    if (pressured_) {
        queue_.insert(queue_.end(),
                      std::make_move_iterator(events.begin()),
                      std::make_move_iterator(events.end()));
        update_exit();
        return {};
    }

    if (queue_.empty()) return events;

    std::vector<StreamEvent> out;
    out.reserve(queue_.size() + events.size());
    out.insert(out.end(),
               std::make_move_iterator(queue_.begin()),
               std::make_move_iterator(queue_.end()));
    out.insert(out.end(),
               std::make_move_iterator(events.begin()),
               std::make_move_iterator(events.end()));
    queue_.clear();
    return out;
}

void BackpressureQueue::inject(StreamEvent event) {
    queue_.push_back(std::move(event));
    if (enabled_ && !pressured_ && queue_.size() > max_pending_) {
        pressured_ = true;
    }
}

std::vector<StreamEvent> BackpressureQueue::drain(size_t max_count) {
    std::vector<StreamEvent> out;
    size_t n = std::min(max_count, queue_.size());
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    update_exit();
    return out;
}

void BackpressureQueue::update_exit() {
    if (pressured_ && queue_.size() * 2 < max_pending_) {
        pressured_ = false;
    }
}

void BackpressureQueue::clear() {
    queue_.clear();
    pressured_ = false;
}

} // namespace chunkflow
