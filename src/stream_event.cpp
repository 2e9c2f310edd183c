#include "stream_event.hpp"

namespace chunkflow {

StreamEvent StreamEvent::content_event(std::string text) {
    StreamEvent ev;
    ev.type = StreamEventType::Content;
    ev.content = std::move(text);
    return ev;
}

StreamEvent StreamEvent::tool_call_event(const ToolCall& call) {
    StreamEvent ev;
    ev.type = StreamEventType::ToolCall;
    ev.tool_call = call;
    return ev;
}

StreamEvent StreamEvent::error_event(std::string code, std::string message) {
    StreamEvent ev;
    ev.type = StreamEventType::Error;
    ev.code = std::move(code);
    ev.content = std::move(message);
    return ev;
}

StreamEvent StreamEvent::done_event() {
    StreamEvent ev;
    ev.type = StreamEventType::Done;
    return ev;
}

nlohmann::json tool_call_to_json(const ToolCall& call) {
    return {
        {"index", call.index},
        {"id", call.id},
        {"name", call.name},
        {"arguments", call.arguments}
    };
}

nlohmann::json event_to_json(const StreamEvent& event) {
    nlohmann::json j;
    j["type"] = event_type_to_string(event.type);
    switch (event.type) {
        case StreamEventType::Content:
            j["content"] = event.content;
            break;
        case StreamEventType::ToolCall:
            if (event.tool_call) {
                j["tool_call"] = tool_call_to_json(*event.tool_call);
            }
            break;
        case StreamEventType::Error:
            j["code"] = event.code;
            j["message"] = event.content;
            break;
        case StreamEventType::Done:
            break;
    }
    return j;
}

} // namespace chunkflow
