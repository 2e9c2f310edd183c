#include "chunk_processor.hpp"
#include "util.hpp"
#include <iostream>

namespace chunkflow {

namespace {

StreamConfig normalized(StreamConfig config) {
    config.normalize();
    return config;
}

std::unique_ptr<ChunkTimer> make_timer(const StreamConfig& config,
                                       std::unique_ptr<ChunkTimer> timer) {
    if (config.chunk_timeout_ms == 0) return nullptr;
    if (timer) return timer;
    return std::make_unique<ThreadChunkTimer>();
}

} // namespace

ChunkProcessor::ChunkProcessor(const StreamConfig& config,
                               Sanitizer sanitizer,
                               std::shared_ptr<const Clock> clock,
                               std::unique_ptr<ChunkTimer> timer)
    : config_(normalized(config))
    , sanitizer_(std::move(sanitizer))
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>())
    , batcher_(config_)
    , queue_(config_.max_pending_events, config_.enable_backpressure)
    , throttle_(config_, *clock_)
    , metrics_(config_.metrics_window)
    , supervisor_(std::chrono::milliseconds(config_.chunk_timeout_ms),
                  make_timer(config_, std::move(timer)))
{}

void ChunkProcessor::start_round() {
    supervisor_.disarm();
    collect_timeouts();

    TimePoint now = clock_->now();
    round_start_ = now;
    metrics_.mark_round_start(now);

    supervisor_.arm();
}

std::vector<StreamEvent> ChunkProcessor::process_delta(const Delta& delta) {
    // A chunk arrived: stop waiting before anything else
    supervisor_.disarm();
    collect_timeouts();

    TimePoint start = clock_->now();
    if (!round_start_) {
        round_start_ = start;
        metrics_.mark_round_start(start);
    }
    if (last_delta_at_) {
        metrics_.record_inter_chunk(elapsed_ms(*last_delta_at_, start));
    }
    last_delta_at_ = start;

    if (!first_chunk_seen_ && delta.has_data()) {
        first_chunk_seen_ = true;
        metrics_.mark_first_chunk(elapsed_ms(*round_start_, start));
    }

    std::vector<StreamEvent> out;
    size_t bytes = 0;
    try {
        std::vector<StreamEvent> events;
        if (delta.has_content()) {
            bytes = delta.content->size();
            ingest_content(*delta.content, start, events);
        }
        for (const auto& fragment : delta.tool_calls) {
            if (auto call = builder_.merge(fragment)) {
                events.push_back(StreamEvent::tool_call_event(*call));
            }
        }
        out = admit(std::move(events));
    } catch (...) {
        // Sanitizer failures belong to the caller; keep supervising the stream
        supervisor_.arm();
        throw;
    }

    supervisor_.arm();

    TimePoint end = clock_->now();
    metrics_.record_chunk(bytes);
    metrics_.record_processing(elapsed_ms(start, end));
    metrics_.mark_activity(end);
    return out;
}

void ChunkProcessor::ingest_content(const std::string& text, TimePoint now,
                                    std::vector<StreamEvent>& events) {
    content_.append_raw(text);

    if (config_.enable_batching && batcher_.should_batch(text.size(), now)) {
        batcher_.add(text, now);
        batcher_.note_arrival(now);
        if (batcher_.should_flush(now)) {
            emit_batch(events);
        }
        return;
    }

    batcher_.note_arrival(now);
    // Keep output order equal to input order
    if (batcher_.has_pending()) {
        emit_batch(events);
    }
    emit_content(text, events);
}

void ChunkProcessor::emit_batch(std::vector<StreamEvent>& events) {
    std::string joined = batcher_.flush();
    metrics_.record_batch_flush();
    emit_content(joined, events);
}

void ChunkProcessor::emit_content(const std::string& text,
                                  std::vector<StreamEvent>& events) {
    std::string out = (config_.sanitize && sanitizer_) ? sanitizer_(text) : text;
    if (out.empty()) return;
    content_.append_sanitized(out);
    events.push_back(StreamEvent::content_event(std::move(out)));
}

std::vector<StreamEvent> ChunkProcessor::flush() {
    collect_timeouts();
    std::vector<StreamEvent> events;
    if (batcher_.has_pending()) {
        emit_batch(events);
    }
    return admit(std::move(events));
}

std::vector<StreamEvent> ChunkProcessor::finish() {
    supervisor_.disarm();
    collect_timeouts();

    std::vector<StreamEvent> events;
    if (batcher_.has_pending()) {
        emit_batch(events);
    }
    if (builder_.empty()) {
        for (const auto& call : fallback_tool_calls()) {
            events.push_back(StreamEvent::tool_call_event(call));
        }
    }
    events.push_back(StreamEvent::done_event());

    metrics_.mark_activity(clock_->now());
    return admit(std::move(events));
}

std::vector<StreamEvent> ChunkProcessor::drain(size_t max_count) {
    collect_timeouts();
    return queue_.drain(max_count);
}

bool ChunkProcessor::under_backpressure() {
    collect_timeouts();
    return queue_.under_backpressure();
}

size_t ChunkProcessor::pending_count() {
    collect_timeouts();
    return queue_.pending();
}

FlowHint ChunkProcessor::flow_hint() {
    collect_timeouts();
    FlowHint hint;
    hint.under_backpressure = queue_.under_backpressure();
    hint.pending_events = queue_.pending();
    hint.render_throttle_ms = throttle_.throttle_ms();
    return hint;
}

std::vector<StreamEvent> ChunkProcessor::admit(std::vector<StreamEvent> events) {
    bool was_pressured = queue_.under_backpressure();
    auto out = queue_.admit(std::move(events));
    note_backpressure(was_pressured);
    return out;
}

void ChunkProcessor::note_backpressure(bool was_pressured) {
    if (was_pressured || !queue_.under_backpressure()) return;
    metrics_.record_backpressure();
    std::cerr << "[stream] Backpressure on: " << queue_.pending()
              << " events pending (max " << queue_.max_pending() << ")\n";
}

void ChunkProcessor::collect_timeouts() {
    uint32_t fired = supervisor_.take_fired();
    if (fired == 0) return;

    std::string message = "No stream data received for " +
        std::to_string(supervisor_.timeout().count()) + " ms";
    std::cerr << "[stream] Chunk timeout: " << message << "\n";

    for (uint32_t i = 0; i < fired; ++i) {
        metrics_.record_timeout();
        bool was_pressured = queue_.under_backpressure();
        queue_.inject(StreamEvent::error_event(error_codes::ChunkTimeout, message));
        note_backpressure(was_pressured);
    }
}

std::vector<ToolCall> ChunkProcessor::tool_calls() {
    if (!builder_.empty()) return builder_.calls();
    return fallback_tool_calls();
}

const std::vector<ToolCall>& ChunkProcessor::fallback_tool_calls() {
    const std::string& raw = content_.raw();
    if (!config_.extract_commentary_tools || raw.empty()) {
        commentary_calls_.clear();
        commentary_scanned_size_.reset();
        return commentary_calls_;
    }

    // Raw content only grows within a round, so its size marks staleness
    if (commentary_scanned_size_ && *commentary_scanned_size_ == raw.size()) {
        return commentary_calls_;
    }

    auto extraction = extract_commentary_tool_calls(raw);
    commentary_calls_.clear();
    for (auto& call : extraction.calls) {
        call.id = "commentary_" + generate_id();
        commentary_calls_.push_back(std::move(call));
    }
    commentary_scanned_size_ = raw.size();
    return commentary_calls_;
}

StreamMetrics ChunkProcessor::metrics() {
    collect_timeouts();
    return metrics_.snapshot();
}

void ChunkProcessor::soft_reset() {
    supervisor_.disarm();
    (void)supervisor_.take_fired();

    content_.clear();
    builder_.clear();
    batcher_.reset();
    queue_.clear();
    commentary_calls_.clear();
    commentary_scanned_size_.reset();

    round_start_.reset();
    last_delta_at_.reset();
    first_chunk_seen_ = false;
}

void ChunkProcessor::reset() {
    soft_reset();
    metrics_.reset();
    throttle_.reset();
}

} // namespace chunkflow
