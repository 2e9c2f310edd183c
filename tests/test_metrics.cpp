#include <catch2/catch.hpp>
#include "stream/metrics.hpp"
#include "stream/rolling_window.hpp"
#include "mock_clock.hpp"

using namespace chunkflow;
using Catch::Detail::Approx;

// ── percentile ───────────────────────────────────────────────────

TEST_CASE("percentile: nearest rank over 1..10", "[metrics]") {
    std::vector<double> samples = {10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
    REQUIRE(percentile(samples, 50) == 5.0);
    REQUIRE(percentile(samples, 95) == 10.0);
    REQUIRE(percentile(samples, 99) == 10.0);
}

TEST_CASE("percentile: single sample and empty set", "[metrics]") {
    REQUIRE(percentile({7.5}, 50) == 7.5);
    REQUIRE(percentile({7.5}, 99) == 7.5);
    REQUIRE(percentile({}, 50) == 0.0);
}

TEST_CASE("population_std_dev: known values", "[metrics]") {
    REQUIRE(population_std_dev({2, 4, 4, 4, 5, 5, 7, 9}) == 2.0);
    REQUIRE(population_std_dev({3}) == 0.0);
    REQUIRE(population_std_dev({}) == 0.0);
}

// ── RollingWindow ────────────────────────────────────────────────

TEST_CASE("RollingWindow: evicts the oldest sample when full", "[metrics]") {
    RollingWindow<double> window(3);
    for (double v : {1.0, 2.0, 3.0, 4.0, 5.0}) window.push(v);

    REQUIRE(window.size() == 3);
    std::vector<double> expected = {3.0, 4.0, 5.0};
    REQUIRE(window.values() == expected);
    REQUIRE(window.sum() == 12.0);
}

TEST_CASE("RollingWindow: clear keeps capacity", "[metrics]") {
    RollingWindow<int> window(4);
    window.push(1);
    window.push(2);
    window.clear();
    REQUIRE(window.empty());
    REQUIRE(window.capacity() == 4);
    window.push(9);
    REQUIRE(window.values().size() == 1);
    REQUIRE(window.values()[0] == 9);
}

// ── MetricsCollector ─────────────────────────────────────────────

TEST_CASE("MetricsCollector: empty snapshot is all zeros", "[metrics]") {
    MetricsCollector collector;
    auto m = collector.snapshot();
    REQUIRE(m.total_chunks == 0);
    REQUIRE(m.avg_processing_ms == 0.0);
    REQUIRE(m.min_processing_ms == 0.0);
    REQUIRE(m.max_processing_ms == 0.0);
    REQUIRE(m.p50_processing_ms == 0.0);
    REQUIRE(m.p99_processing_ms == 0.0);
    REQUIRE(m.jitter_ms == 0.0);
    REQUIRE(m.chunks_per_second == 0.0);
    REQUIRE(m.total_elapsed_ms == 0.0);
}

TEST_CASE("MetricsCollector: processing statistics over the window", "[metrics]") {
    MetricsCollector collector;
    for (int i = 1; i <= 10; ++i) {
        collector.record_chunk(4);
        collector.record_processing(static_cast<double>(i));
    }

    auto m = collector.snapshot();
    REQUIRE(m.total_chunks == 10);
    REQUIRE(m.total_bytes == 40);
    REQUIRE(m.avg_processing_ms == 5.5);
    REQUIRE(m.min_processing_ms == 1.0);
    REQUIRE(m.max_processing_ms == 10.0);
    REQUIRE(m.p50_processing_ms == 5.0);
    REQUIRE(m.p95_processing_ms == 10.0);
    REQUIRE(m.p99_processing_ms == 10.0);
    REQUIRE(m.jitter_ms == Approx(2.8722813));
}

TEST_CASE("MetricsCollector: window drops old samples but counters keep counting", "[metrics]") {
    MetricsCollector collector(5);
    for (int i = 1; i <= 10; ++i) {
        collector.record_chunk(1);
        collector.record_processing(static_cast<double>(i));
    }

    auto m = collector.snapshot();
    REQUIRE(m.total_chunks == 10);
    REQUIRE(m.min_processing_ms == 6.0);
    REQUIRE(m.max_processing_ms == 10.0);
    REQUIRE(m.avg_processing_ms == 8.0);
}

TEST_CASE("MetricsCollector: throughput over elapsed time", "[metrics]") {
    ManualClock clock;
    MetricsCollector collector;

    collector.mark_round_start(clock.now());
    collector.record_chunk(100);
    collector.record_chunk(100);
    clock.advance(500.0);
    collector.mark_activity(clock.now());

    auto m = collector.snapshot();
    REQUIRE(m.total_elapsed_ms == 500.0);
    REQUIRE(m.chunks_per_second == 4.0);
    REQUIRE(m.bytes_per_second == 400.0);
}

TEST_CASE("MetricsCollector: later round starts keep the session start", "[metrics]") {
    ManualClock clock;
    MetricsCollector collector;

    collector.mark_round_start(clock.now());
    clock.advance(100.0);
    collector.mark_round_start(clock.now());
    collector.mark_activity(clock.now());

    REQUIRE(collector.snapshot().total_elapsed_ms == 100.0);
}

TEST_CASE("MetricsCollector: counters and reset", "[metrics]") {
    MetricsCollector collector;
    collector.record_batch_flush();
    collector.record_batch_flush();
    collector.record_backpressure();
    collector.record_timeout();
    collector.record_inter_chunk(10.0);
    collector.record_inter_chunk(20.0);
    collector.mark_first_chunk(42.0);

    auto m = collector.snapshot();
    REQUIRE(m.batch_flushes == 2);
    REQUIRE(m.backpressure_events == 1);
    REQUIRE(m.chunk_timeouts == 1);
    REQUIRE(m.avg_inter_chunk_ms == 15.0);
    REQUIRE(m.time_to_first_chunk_ms == 42.0);

    collector.reset();
    m = collector.snapshot();
    REQUIRE(m.batch_flushes == 0);
    REQUIRE(m.backpressure_events == 0);
    REQUIRE(m.chunk_timeouts == 0);
    REQUIRE(m.avg_inter_chunk_ms == 0.0);
    REQUIRE(m.time_to_first_chunk_ms == 0.0);
}

TEST_CASE("StreamMetrics: to_json carries every field", "[metrics]") {
    StreamMetrics m;
    m.total_chunks = 3;
    m.p95_processing_ms = 1.5;
    auto j = m.to_json();
    REQUIRE(j["total_chunks"] == 3);
    REQUIRE(j["p95_processing_ms"] == 1.5);
    REQUIRE(j.contains("jitter_ms"));
    REQUIRE(j.contains("chunk_timeouts"));
    REQUIRE(j.size() == 17);
}
