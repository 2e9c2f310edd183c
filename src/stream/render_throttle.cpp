#include "render_throttle.hpp"
#include <algorithm>

namespace chunkflow {

RenderThrottle::RenderThrottle(const StreamConfig& config, const Clock& clock)
    : clock_(clock)
    , min_ms_(static_cast<double>(config.min_render_throttle_ms))
    , max_ms_(static_cast<double>(std::max(config.min_render_throttle_ms,
                                           config.max_render_throttle_ms)))
    , adaptive_(config.adaptive_throttle)
    , durations_(config.render_window)
{
    initial_ms_ = std::clamp(static_cast<double>(config.render_throttle_ms), min_ms_, max_ms_);
    throttle_ms_ = initial_ms_;
}

bool RenderThrottle::should_render() {
    TimePoint now = clock_.now();
    if (last_render_ && elapsed_ms(*last_render_, now) < throttle_ms_) {
        return false;
    }
    last_render_ = now;
    return true;
}

void RenderThrottle::report_render_duration(double ms) {
    durations_.push(ms);
    if (!adaptive_ || durations_.size() < kMinSamples) return;

    double avg = durations_.sum() / static_cast<double>(durations_.size());
    if (avg > throttle_ms_ * kSlowRatio) {
        throttle_ms_ = std::min(throttle_ms_ * (1.0 + kStep), max_ms_);
    } else if (avg < throttle_ms_ * kFastRatio) {
        throttle_ms_ = std::max(throttle_ms_ * (1.0 - kStep), min_ms_);
    }
}

void RenderThrottle::reset() {
    throttle_ms_ = initial_ms_;
    durations_.clear();
    last_render_.reset();
}

} // namespace chunkflow
