#pragma once
#include "../clock.hpp"
#include "rolling_window.hpp"
#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace chunkflow {

// Point-in-time view of stream performance. Window statistics (processing
// time avg/min/max, percentiles, jitter, inter-chunk average) cover only the
// most recent samples; counters are cumulative since the last hard reset.
struct StreamMetrics {
    uint64_t total_chunks = 0;
    uint64_t total_bytes = 0;
    double avg_processing_ms = 0.0;
    double min_processing_ms = 0.0;
    double max_processing_ms = 0.0;
    double time_to_first_chunk_ms = 0.0;
    double total_elapsed_ms = 0.0;
    double chunks_per_second = 0.0;
    double bytes_per_second = 0.0;
    uint32_t batch_flushes = 0;
    uint32_t backpressure_events = 0;
    uint32_t chunk_timeouts = 0;
    double p50_processing_ms = 0.0;
    double p95_processing_ms = 0.0;
    double p99_processing_ms = 0.0;
    double jitter_ms = 0.0;
    double avg_inter_chunk_ms = 0.0;

    nlohmann::json to_json() const;
};

// Nearest-rank percentile: sort ascending, take index ceil(p/100 * n) - 1.
// Returns 0 for an empty sample set.
double percentile(std::vector<double> samples, double p);

// Population standard deviation; 0 for fewer than two samples.
double population_std_dev(const std::vector<double>& samples);

class MetricsCollector {
public:
    explicit MetricsCollector(size_t window = 100);

    void record_chunk(size_t bytes);
    void record_processing(double ms);
    void record_inter_chunk(double ms);
    void record_batch_flush() { batch_flushes_++; }
    void record_backpressure() { backpressure_events_++; }
    void record_timeout() { chunk_timeouts_++; }

    // Elapsed time runs from the first round start after a reset to the
    // latest activity.
    void mark_round_start(TimePoint t);
    void mark_first_chunk(double ms) { time_to_first_chunk_ms_ = ms; }
    void mark_activity(TimePoint t) { last_activity_ = t; }

    StreamMetrics snapshot() const;

    void reset();

private:
    RollingWindow<double> processing_;
    RollingWindow<double> inter_chunk_;
    uint64_t total_chunks_ = 0;
    uint64_t total_bytes_ = 0;
    uint32_t batch_flushes_ = 0;
    uint32_t backpressure_events_ = 0;
    uint32_t chunk_timeouts_ = 0;
    double time_to_first_chunk_ms_ = 0.0;
    std::optional<TimePoint> session_start_;
    std::optional<TimePoint> last_activity_;
};

} // namespace chunkflow
