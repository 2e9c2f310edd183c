#pragma once
#include "../clock.hpp"
#include "../config.hpp"
#include "rolling_window.hpp"
#include <optional>

namespace chunkflow {

// Advises the renderer how often it may redraw. With adaptation on, the
// interval grows by 20% when renders average over 80% of it and shrinks by
// 20% when they average under 30%, always staying within [min, max].
// Adjustments happen only when a duration is reported.
class RenderThrottle {
public:
    RenderThrottle(const StreamConfig& config, const Clock& clock);

    // True on the first call and then at most once per interval. A true
    // result restarts the interval.
    bool should_render();

    void report_render_duration(double ms);

    double throttle_ms() const { return throttle_ms_; }
    double min_ms() const { return min_ms_; }
    double max_ms() const { return max_ms_; }

    void reset();

private:
    static constexpr size_t kMinSamples = 3;
    static constexpr double kSlowRatio = 0.8;
    static constexpr double kFastRatio = 0.3;
    static constexpr double kStep = 0.2;

    const Clock& clock_;
    double initial_ms_;
    double min_ms_;
    double max_ms_;
    bool adaptive_;
    double throttle_ms_;
    RollingWindow<double> durations_;
    std::optional<TimePoint> last_render_;
};

} // namespace chunkflow
