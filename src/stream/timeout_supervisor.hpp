#pragma once
#include "../timer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace chunkflow {

// Watches for stalls between chunks with a single re-armable timer.
//
// The timer callback only bumps atomics; the owning processor collects fired
// timeouts with take_fired() on its own thread. Callers must disarm before
// re-arming so a chunk that arrives right at the deadline cannot be followed
// by a stale fire.
class TimeoutSupervisor {
public:
    // timeout of zero disables supervision; no timer is used.
    TimeoutSupervisor(std::chrono::milliseconds timeout, std::unique_ptr<ChunkTimer> timer);
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    bool enabled() const { return timeout_.count() > 0 && timer_ != nullptr; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    void arm();
    void disarm();
    bool armed() const { return enabled() && timer_->armed(); }

    // Timeouts fired since the previous call
    uint32_t take_fired() { return fired_.exchange(0); }

private:
    std::chrono::milliseconds timeout_;
    std::unique_ptr<ChunkTimer> timer_;
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint32_t> fired_{0};
};

} // namespace chunkflow
