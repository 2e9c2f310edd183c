#include <catch2/catch.hpp>
#include "stream/timeout_supervisor.hpp"
#include "chunk_processor.hpp"
#include "mock_timer.hpp"
#include <atomic>
#include <thread>

using namespace chunkflow;
using namespace std::chrono_literals;

// ── TimeoutSupervisor ────────────────────────────────────────────

TEST_CASE("TimeoutSupervisor: fire is counted once and taken once", "[timeout]") {
    auto timer = std::make_unique<ManualChunkTimer>();
    auto* t = timer.get();
    TimeoutSupervisor sup(50ms, std::move(timer));

    sup.arm();
    REQUIRE(sup.armed());
    REQUIRE(t->fire());
    REQUIRE_FALSE(sup.armed());

    REQUIRE(sup.take_fired() == 1);
    REQUIRE(sup.take_fired() == 0);
}

TEST_CASE("TimeoutSupervisor: disarm cancels the pending deadline", "[timeout]") {
    auto timer = std::make_unique<ManualChunkTimer>();
    auto* t = timer.get();
    TimeoutSupervisor sup(50ms, std::move(timer));

    sup.arm();
    sup.disarm();
    REQUIRE_FALSE(t->fire());
    REQUIRE(sup.take_fired() == 0);
}

TEST_CASE("TimeoutSupervisor: callback from an earlier arm is ignored", "[timeout]") {
    auto timer = std::make_unique<ManualChunkTimer>();
    auto* t = timer.get();
    TimeoutSupervisor sup(50ms, std::move(timer));

    sup.arm();
    auto stale = t->callback;
    sup.disarm();
    sup.arm();

    stale();
    REQUIRE(sup.take_fired() == 0);

    t->fire();
    REQUIRE(sup.take_fired() == 1);
}

TEST_CASE("TimeoutSupervisor: zero timeout is disabled", "[timeout]") {
    auto timer = std::make_unique<ManualChunkTimer>();
    auto* t = timer.get();
    TimeoutSupervisor sup(0ms, std::move(timer));

    REQUIRE_FALSE(sup.enabled());
    sup.arm();
    REQUIRE_FALSE(t->is_armed);
}

TEST_CASE("TimeoutSupervisor: missing timer is disabled", "[timeout]") {
    TimeoutSupervisor sup(50ms, nullptr);
    REQUIRE_FALSE(sup.enabled());
    sup.arm();
    sup.disarm();
    REQUIRE_FALSE(sup.armed());
}

// ── ThreadChunkTimer ─────────────────────────────────────────────

TEST_CASE("ThreadChunkTimer: fires once after the deadline", "[timeout][thread]") {
    ThreadChunkTimer timer;
    std::atomic<int> fired{0};

    timer.arm(20ms, [&fired]() { fired++; });
    REQUIRE(timer.armed());
    std::this_thread::sleep_for(120ms);

    REQUIRE(fired.load() == 1);
    REQUIRE_FALSE(timer.armed());
}

TEST_CASE("ThreadChunkTimer: disarm before the deadline prevents the fire", "[timeout][thread]") {
    ThreadChunkTimer timer;
    std::atomic<int> fired{0};

    timer.arm(200ms, [&fired]() { fired++; });
    timer.disarm();
    std::this_thread::sleep_for(50ms);

    REQUIRE(fired.load() == 0);
    REQUIRE_FALSE(timer.armed());
}

TEST_CASE("ThreadChunkTimer: re-arming pushes the deadline out", "[timeout][thread]") {
    ThreadChunkTimer timer;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    timer.arm(150ms, [&first]() { first++; });
    timer.arm(20ms, [&second]() { second++; });
    std::this_thread::sleep_for(250ms);

    REQUIRE(first.load() == 0);
    REQUIRE(second.load() == 1);
}

TEST_CASE("ThreadChunkTimer: destruction while armed is clean", "[timeout][thread]") {
    std::atomic<int> fired{0};
    {
        ThreadChunkTimer timer;
        timer.arm(1000ms, [&fired]() { fired++; });
    }
    REQUIRE(fired.load() == 0);
}

// ── Processor with a real timer ──────────────────────────────────

TEST_CASE("ChunkProcessor: stalled stream yields exactly one timeout", "[timeout][thread]") {
    StreamConfig cfg;
    cfg.chunk_timeout_ms = 50;
    cfg.sanitize = false;
    ChunkProcessor proc(cfg);

    proc.process_delta([] { Delta d; d.content = "a"; return d; }());
    std::this_thread::sleep_for(150ms);

    auto events = proc.drain();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == StreamEventType::Error);
    REQUIRE(events[0].code == error_codes::ChunkTimeout);
    REQUIRE(proc.metrics().chunk_timeouts == 1);
}
