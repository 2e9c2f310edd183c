#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chunkflow {

struct StreamConfig {
    bool sanitize = true;
    bool extract_commentary_tools = true;

    bool enable_batching = true;
    uint32_t batch_size_threshold = 64;    // bytes
    uint32_t batch_time_threshold_ms = 16;
    double batch_isolation_factor = 2.0;   // x batch_time_threshold_ms

    bool enable_backpressure = true;
    uint32_t max_pending_events = 100;

    uint32_t render_throttle_ms = 16;
    bool adaptive_throttle = true;
    uint32_t min_render_throttle_ms = 8;
    uint32_t max_render_throttle_ms = 50;

    uint32_t chunk_timeout_ms = 5000;      // 0 = disabled

    uint32_t metrics_window = 100;         // samples kept per rolling window
    uint32_t render_window = 20;           // render durations kept for adaptation

    // Load from ~/.chunkflow/config.json + env vars
    static StreamConfig load();

    // Load from an explicit path + env vars. A missing file yields defaults.
    static StreamConfig load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Read the keys of a "stream" object. Wrongly-typed keys are ignored.
    static StreamConfig from_json(const nlohmann::json& stream);

    nlohmann::json to_json() const;

    // Clamp inconsistent values (min above max, zero windows or max pending)
    void normalize();

    // Apply CHUNKFLOW_* environment overrides
    void apply_env();
};

} // namespace chunkflow
