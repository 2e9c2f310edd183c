#pragma once
#include <chrono>

namespace chunkflow {

using TimePoint = std::chrono::steady_clock::time_point;

// Fractional milliseconds, used for all latency bookkeeping
using Millis = std::chrono::duration<double, std::milli>;

inline double elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Millis>(to - from).count();
}

// Abstract monotonic clock (injectable for testing)
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace chunkflow
