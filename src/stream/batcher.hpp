#pragma once
#include "../clock.hpp"
#include "../config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Coalesces bursts of small content fragments into one event.
//
// A fragment joins a batch only if it is smaller than the size threshold and
// arrived within isolation_factor x time threshold of the previous fragment.
// The first fragment of a round has no predecessor, so it is never batched.
// A batch flushes once it holds size-threshold bytes or has been open for the
// time threshold, whichever comes first.
class ContentBatcher {
public:
    explicit ContentBatcher(const StreamConfig& config);

    bool should_batch(size_t length, TimePoint now) const;
    bool should_flush(TimePoint now) const;

    void add(std::string fragment, TimePoint now);

    // Join and clear the pending fragments
    std::string flush();

    // Record the arrival of any content fragment, batched or not
    void note_arrival(TimePoint now) { last_arrival_ = now; }

    bool has_pending() const { return !pending_.empty(); }
    size_t pending_bytes() const { return pending_bytes_; }

    // Forget the pending batch and the arrival history
    void reset();

private:
    size_t size_threshold_;
    double time_threshold_ms_;
    double isolation_ms_;

    std::vector<std::string> pending_;
    size_t pending_bytes_ = 0;
    TimePoint opened_at_{};
    std::optional<TimePoint> last_arrival_;
};

} // namespace chunkflow
