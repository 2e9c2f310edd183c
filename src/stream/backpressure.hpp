#pragma once
#include "../stream_event.hpp"
#include <cstddef>
#include <deque>
#include <limits>
#include <vector>

namespace chunkflow {

// Defers events while the consumer falls behind.
//
// Backpressure switches on when queued + new events exceed max_pending and
// switches off once the queue drops below max_pending / 2. While on, admitted
// events are queued and nothing is returned. While off, queued events are
// released ahead of new ones so output order is preserved.
class BackpressureQueue {
public:
    // max_pending of zero is treated as one
    BackpressureQueue(size_t max_pending, bool enabled);

    // Hand over freshly produced events; returns the events the caller may
    // consume now.
    std::vector<StreamEvent> admit(std::vector<StreamEvent> events);

    // Queue an out-of-band event for pickup on the next admit or drain
    void inject(StreamEvent event);

    // Remove up to max_count events from the front of the queue
    std::vector<StreamEvent> drain(size_t max_count = std::numeric_limits<size_t>::max());

    bool under_backpressure() const { return pressured_; }
    size_t pending() const { return queue_.size(); }
    size_t max_pending() const { return max_pending_; }

    void clear();

private:
    void update_exit();

    size_t max_pending_;
    bool enabled_;
    bool pressured_ = false;
    std::deque<StreamEvent> queue_;
};

} // namespace chunkflow
