#include "metrics.hpp"
#include <algorithm>
#include <cmath>

namespace chunkflow {

nlohmann::json StreamMetrics::to_json() const {
    return {
        {"total_chunks", total_chunks},
        {"total_bytes", total_bytes},
        {"avg_processing_ms", avg_processing_ms},
        {"min_processing_ms", min_processing_ms},
        {"max_processing_ms", max_processing_ms},
        {"time_to_first_chunk_ms", time_to_first_chunk_ms},
        {"total_elapsed_ms", total_elapsed_ms},
        {"chunks_per_second", chunks_per_second},
        {"bytes_per_second", bytes_per_second},
        {"batch_flushes", batch_flushes},
        {"backpressure_events", backpressure_events},
        {"chunk_timeouts", chunk_timeouts},
        {"p50_processing_ms", p50_processing_ms},
        {"p95_processing_ms", p95_processing_ms},
        {"p99_processing_ms", p99_processing_ms},
        {"jitter_ms", jitter_ms},
        {"avg_inter_chunk_ms", avg_inter_chunk_ms}
    };
}

double percentile(std::vector<double> samples, double p) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    double rank = std::ceil(p * static_cast<double>(samples.size()) / 100.0) - 1.0;
    size_t idx = rank < 0.0 ? 0 : static_cast<size_t>(rank);
    if (idx >= samples.size()) idx = samples.size() - 1;
    return samples[idx];
}

double population_std_dev(const std::vector<double>& samples) {
    if (samples.size() < 2) return 0.0;
    double mean = 0.0;
    for (double s : samples) mean += s;
    mean /= static_cast<double>(samples.size());
    double var = 0.0;
    for (double s : samples) var += (s - mean) * (s - mean);
    var /= static_cast<double>(samples.size());
    return std::sqrt(var);
}

MetricsCollector::MetricsCollector(size_t window)
    : processing_(window), inter_chunk_(window)
{}

void MetricsCollector::record_chunk(size_t bytes) {
    total_chunks_++;
    total_bytes_ += bytes;
}

void MetricsCollector::record_processing(double ms) {
    processing_.push(ms);
}

void MetricsCollector::record_inter_chunk(double ms) {
    inter_chunk_.push(ms);
}

void MetricsCollector::mark_round_start(TimePoint t) {
    if (!session_start_) session_start_ = t;
    if (!last_activity_) last_activity_ = t;
}

StreamMetrics MetricsCollector::snapshot() const {
    StreamMetrics m;
    m.total_chunks = total_chunks_;
    m.total_bytes = total_bytes_;
    m.batch_flushes = batch_flushes_;
    m.backpressure_events = backpressure_events_;
    m.chunk_timeouts = chunk_timeouts_;
    m.time_to_first_chunk_ms = time_to_first_chunk_ms_;

    if (session_start_ && last_activity_) {
        m.total_elapsed_ms = std::max(0.0, elapsed_ms(*session_start_, *last_activity_));
    }
    if (m.total_elapsed_ms > 0.0) {
        double seconds = m.total_elapsed_ms / 1000.0;
        m.chunks_per_second = static_cast<double>(total_chunks_) / seconds;
        m.bytes_per_second = static_cast<double>(total_bytes_) / seconds;
    }

    if (!processing_.empty()) {
        auto samples = processing_.values();
        auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
        m.min_processing_ms = *lo;
        m.max_processing_ms = *hi;
        m.avg_processing_ms = processing_.sum() / static_cast<double>(samples.size());
        m.p50_processing_ms = percentile(samples, 50);
        m.p95_processing_ms = percentile(samples, 95);
        m.p99_processing_ms = percentile(samples, 99);
        m.jitter_ms = population_std_dev(samples);
    }

    if (!inter_chunk_.empty()) {
        m.avg_inter_chunk_ms = inter_chunk_.sum() / static_cast<double>(inter_chunk_.size());
    }

    return m;
}

void MetricsCollector::reset() {
    processing_.clear();
    inter_chunk_.clear();
    total_chunks_ = 0;
    total_bytes_ = 0;
    batch_flushes_ = 0;
    backpressure_events_ = 0;
    chunk_timeouts_ = 0;
    time_to_first_chunk_ms_ = 0.0;
    session_start_.reset();
    last_activity_.reset();
}

} // namespace chunkflow
