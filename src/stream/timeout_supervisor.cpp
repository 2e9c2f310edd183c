#include "timeout_supervisor.hpp"

namespace chunkflow {

TimeoutSupervisor::TimeoutSupervisor(std::chrono::milliseconds timeout,
                                     std::unique_ptr<ChunkTimer> timer)
    : timeout_(timeout), timer_(std::move(timer))
{}

TimeoutSupervisor::~TimeoutSupervisor() {
    if (timer_) timer_->disarm();
}

void TimeoutSupervisor::arm() {
    if (!enabled()) return;
    uint64_t gen = generation_.load();
    timer_->arm(timeout_, [this, gen]() {
        // A fire racing with disarm() belongs to a finished wait
        if (generation_.load() == gen) {
            fired_.fetch_add(1);
        }
    });
}

void TimeoutSupervisor::disarm() {
    if (!enabled()) return;
    generation_.fetch_add(1);
    timer_->disarm();
}

} // namespace chunkflow
