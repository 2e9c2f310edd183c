#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "delta.hpp"
#include "sanitize.hpp"
#include "stream_event.hpp"
#include "timer.hpp"
#include "stream/accumulator.hpp"
#include "stream/backpressure.hpp"
#include "stream/batcher.hpp"
#include "stream/metrics.hpp"
#include "stream/render_throttle.hpp"
#include "stream/timeout_supervisor.hpp"
#include "stream/tool_call_builder.hpp"
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Content filter applied to every emitted fragment. Exceptions it throws
// propagate out of the processor call that triggered it.
using Sanitizer = std::function<std::string(const std::string&)>;

// Polled flow-control advice for the consumer
struct FlowHint {
    bool under_backpressure = false;
    size_t pending_events = 0;
    double render_throttle_ms = 0.0;
};

// Turns a stream of model deltas into renderable events.
//
// Not thread-safe: one caller drives a processor. The only concurrent actor
// is the chunk timeout timer, whose fires are collected on the next call.
class ChunkProcessor {
public:
    explicit ChunkProcessor(const StreamConfig& config = StreamConfig{},
                            Sanitizer sanitizer = sanitize_llm_output,
                            std::shared_ptr<const Clock> clock = nullptr,
                            std::unique_ptr<ChunkTimer> timer = nullptr);

    // Optional: mark the moment the request went out, so time-to-first-chunk
    // covers the model's latency and the timeout covers the first wait.
    void start_round();

    // Ingest one delta. Returns the events the caller may consume now; under
    // backpressure they are queued instead and an empty list is returned.
    std::vector<StreamEvent> process_delta(const Delta& delta);

    // Emit whatever the batcher holds. Call when the upstream stream ends.
    std::vector<StreamEvent> flush();

    // End of response: flush, synthesize commentary tool calls if no native
    // call arrived, append a done event and stop the chunk timer.
    std::vector<StreamEvent> finish();

    // Take up to max_count queued events, re-evaluating backpressure
    std::vector<StreamEvent> drain(size_t max_count = std::numeric_limits<size_t>::max());

    // Flow state includes timeouts that fired since the last call
    bool under_backpressure();
    size_t pending_count();
    FlowHint flow_hint();

    bool should_render() { return throttle_.should_render(); }
    void report_render_duration(double ms) { throttle_.report_render_duration(ms); }
    double render_throttle_ms() const { return throttle_.throttle_ms(); }

    const std::string& accumulated_content() const { return content_.sanitized(); }
    const std::string& raw_content() const { return content_.raw(); }

    // Native tool calls in index order, or commentary-extracted calls when no
    // native call arrived this round.
    std::vector<ToolCall> tool_calls();

    StreamMetrics metrics();

    // Clear round state (content, tool calls, batch, queue, timer) but keep
    // metrics and render adaptation. For the next turn of a session.
    void soft_reset();

    // Clear everything
    void reset();

    const StreamConfig& config() const { return config_; }

private:
    void ingest_content(const std::string& text, TimePoint now,
                        std::vector<StreamEvent>& events);
    void emit_batch(std::vector<StreamEvent>& events);
    void emit_content(const std::string& text, std::vector<StreamEvent>& events);
    std::vector<StreamEvent> admit(std::vector<StreamEvent> events);
    void note_backpressure(bool was_pressured);
    void collect_timeouts();
    const std::vector<ToolCall>& fallback_tool_calls();

    StreamConfig config_;
    Sanitizer sanitizer_;
    std::shared_ptr<const Clock> clock_;

    ContentAccumulator content_;
    ToolCallBuilder builder_;
    ContentBatcher batcher_;
    BackpressureQueue queue_;
    RenderThrottle throttle_;
    MetricsCollector metrics_;

    std::optional<TimePoint> round_start_;
    std::optional<TimePoint> last_delta_at_;
    bool first_chunk_seen_ = false;

    std::vector<ToolCall> commentary_calls_;
    std::optional<size_t> commentary_scanned_size_;

    // Last member: its timer is stopped before anything else is torn down
    TimeoutSupervisor supervisor_;
};

} // namespace chunkflow
