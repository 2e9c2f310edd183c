#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace chunkflow {

// Single-shot, re-armable timer with at most one outstanding deadline.
// Abstract so tests can fire it by hand.
class ChunkTimer {
public:
    using Callback = std::function<void()>;

    virtual ~ChunkTimer() = default;

    // Arm for `timeout` from now. Replaces any outstanding deadline and callback.
    virtual void arm(std::chrono::milliseconds timeout, Callback on_fire) = 0;

    // Cancel the outstanding deadline, if any. After this returns the previous
    // callback is not running and will not run.
    virtual void disarm() = 0;

    virtual bool armed() const = 0;
};

// Timer backed by one background thread. The callback runs on that thread
// with the timer lock held, so it must be short and must not call back into
// the timer.
class ThreadChunkTimer : public ChunkTimer {
public:
    ThreadChunkTimer();
    ~ThreadChunkTimer() override;

    ThreadChunkTimer(const ThreadChunkTimer&) = delete;
    ThreadChunkTimer& operator=(const ThreadChunkTimer&) = delete;

    void arm(std::chrono::milliseconds timeout, Callback on_fire) override;
    void disarm() override;
    bool armed() const override;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    bool stopping_ = false;
    std::chrono::steady_clock::time_point deadline_;
    Callback callback_;
    std::thread thread_;
};

} // namespace chunkflow
