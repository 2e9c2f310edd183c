#include "timer.hpp"

namespace chunkflow {

ThreadChunkTimer::ThreadChunkTimer()
    : thread_([this]() { run(); })
{}

ThreadChunkTimer::~ThreadChunkTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        armed_ = false;
        callback_ = nullptr;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ThreadChunkTimer::arm(std::chrono::milliseconds timeout, Callback on_fire) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + timeout;
        callback_ = std::move(on_fire);
        armed_ = true;
    }
    cv_.notify_all();
}

void ThreadChunkTimer::disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = false;
        callback_ = nullptr;
    }
    cv_.notify_all();
}

bool ThreadChunkTimer::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void ThreadChunkTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!armed_) {
            cv_.wait(lock);
            continue;
        }

        auto deadline = deadline_;
        cv_.wait_until(lock, deadline);

        // Woken by arm/disarm/stop or spuriously: re-evaluate against the
        // current deadline, which may have moved.
        if (stopping_ || !armed_) continue;
        if (std::chrono::steady_clock::now() < deadline_) continue;

        armed_ = false;
        Callback cb = std::move(callback_);
        callback_ = nullptr;
        if (cb) cb();
    }
}

} // namespace chunkflow
