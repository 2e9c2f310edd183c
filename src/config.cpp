#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace chunkflow {

nlohmann::json StreamConfig::defaults_json() {
    StreamConfig defaults;
    return {{"stream", defaults.to_json()}};
}

nlohmann::json StreamConfig::to_json() const {
    return {
        {"sanitize", sanitize},
        {"extract_commentary_tools", extract_commentary_tools},
        {"enable_batching", enable_batching},
        {"batch_size_threshold", batch_size_threshold},
        {"batch_time_threshold_ms", batch_time_threshold_ms},
        {"batch_isolation_factor", batch_isolation_factor},
        {"enable_backpressure", enable_backpressure},
        {"max_pending_events", max_pending_events},
        {"render_throttle_ms", render_throttle_ms},
        {"adaptive_throttle", adaptive_throttle},
        {"min_render_throttle_ms", min_render_throttle_ms},
        {"max_render_throttle_ms", max_render_throttle_ms},
        {"chunk_timeout_ms", chunk_timeout_ms},
        {"metrics_window", metrics_window},
        {"render_window", render_window}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

static void read_uint(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (!j.contains(key) || !j[key].is_number_unsigned()) return;
    uint64_t value = j[key].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << value << "\n";
        return;
    }
    out = static_cast<uint32_t>(value);
}

StreamConfig StreamConfig::from_json(const nlohmann::json& s) {
    StreamConfig cfg;
    if (!s.is_object()) return cfg;

    read_bool(s, "sanitize", cfg.sanitize);
    read_bool(s, "extract_commentary_tools", cfg.extract_commentary_tools);
    read_bool(s, "enable_batching", cfg.enable_batching);
    read_uint(s, "batch_size_threshold", cfg.batch_size_threshold);
    read_uint(s, "batch_time_threshold_ms", cfg.batch_time_threshold_ms);
    if (s.contains("batch_isolation_factor") && s["batch_isolation_factor"].is_number())
        cfg.batch_isolation_factor = s["batch_isolation_factor"].get<double>();
    read_bool(s, "enable_backpressure", cfg.enable_backpressure);
    read_uint(s, "max_pending_events", cfg.max_pending_events);
    read_uint(s, "render_throttle_ms", cfg.render_throttle_ms);
    read_bool(s, "adaptive_throttle", cfg.adaptive_throttle);
    read_uint(s, "min_render_throttle_ms", cfg.min_render_throttle_ms);
    read_uint(s, "max_render_throttle_ms", cfg.max_render_throttle_ms);
    read_uint(s, "chunk_timeout_ms", cfg.chunk_timeout_ms);
    read_uint(s, "metrics_window", cfg.metrics_window);
    read_uint(s, "render_window", cfg.render_window);

    cfg.normalize();
    return cfg;
}

void StreamConfig::normalize() {
    if (min_render_throttle_ms > max_render_throttle_ms)
        max_render_throttle_ms = min_render_throttle_ms;
    render_throttle_ms = std::clamp(render_throttle_ms,
                                    min_render_throttle_ms, max_render_throttle_ms);
    if (batch_isolation_factor < 0.0) batch_isolation_factor = 0.0;
    if (max_pending_events == 0) max_pending_events = 1;
    if (metrics_window == 0) metrics_window = 1;
    if (render_window == 0) render_window = 1;
}

void StreamConfig::apply_env() {
    uint32_t value = 0;
    if (const char* v = std::getenv("CHUNKFLOW_CHUNK_TIMEOUT_MS")) {
        if (parse_uint32(v, value)) chunk_timeout_ms = value;
        else std::cerr << "[config] Ignoring invalid CHUNKFLOW_CHUNK_TIMEOUT_MS: " << v << "\n";
    }
    if (const char* v = std::getenv("CHUNKFLOW_MAX_PENDING_EVENTS")) {
        if (parse_uint32(v, value)) max_pending_events = value;
        else std::cerr << "[config] Ignoring invalid CHUNKFLOW_MAX_PENDING_EVENTS: " << v << "\n";
    }
    if (const char* v = std::getenv("CHUNKFLOW_DISABLE_BATCHING")) {
        if (std::string(v) == "1") enable_batching = false;
    }
    if (const char* v = std::getenv("CHUNKFLOW_DISABLE_SANITIZE")) {
        if (std::string(v) == "1") sanitize = false;
    }
}

StreamConfig StreamConfig::load() {
    return load(expand_home("~/.chunkflow/config.json"));
}

StreamConfig StreamConfig::load(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            j = merge_defaults(original, defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << path
                      << ", using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    }

    StreamConfig cfg;
    if (j.contains("stream") && j["stream"].is_object()) {
        cfg = from_json(j["stream"]);
    }

    // Environment variables always override config file
    cfg.apply_env();
    cfg.normalize();
    return cfg;
}

} // namespace chunkflow
