#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace chunkflow {

struct ToolCall {
    int index = 0;
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string, possibly partial while streaming
};

enum class StreamEventType { Content, ToolCall, Error, Done };

inline const char* event_type_to_string(StreamEventType type) {
    switch (type) {
        case StreamEventType::Content: return "content";
        case StreamEventType::ToolCall: return "tool_call";
        case StreamEventType::Error: return "error";
        case StreamEventType::Done: return "done";
    }
    return "content";
}

namespace error_codes {
    constexpr const char* ChunkTimeout = "chunk_timeout";
} // namespace error_codes

struct StreamEvent {
    StreamEventType type = StreamEventType::Content;
    std::string content;               // Content text or Error message
    std::optional<ToolCall> tool_call; // set for ToolCall
    std::string code;                  // machine-readable Error code

    static StreamEvent content_event(std::string text);
    static StreamEvent tool_call_event(const ToolCall& call);
    static StreamEvent error_event(std::string code, std::string message);
    static StreamEvent done_event();
};

nlohmann::json tool_call_to_json(const ToolCall& call);
nlohmann::json event_to_json(const StreamEvent& event);

} // namespace chunkflow
