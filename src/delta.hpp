#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace chunkflow {

// One index-addressed piece of a streamed tool call
struct ToolCallFragment {
    int index = 0;
    std::optional<std::string> id;
    std::optional<std::string> name;      // partial name
    std::optional<std::string> arguments; // partial arguments JSON
};

// One unit of streamed model output
struct Delta {
    std::optional<std::string> content;
    std::vector<ToolCallFragment> tool_calls;

    bool has_content() const { return content.has_value() && !content->empty(); }
    bool has_data() const { return has_content() || !tool_calls.empty(); }
};

// Decode a delta from JSON. Accepts the bare shape
// {"content": ..., "tool_calls": [...]} and the chat-completions chunk shape
// {"choices": [{"delta": {...}}]}. Tool-call fragments may carry name and
// arguments either under "function" or at the top level. Missing or
// wrongly-typed fields are treated as absent.
Delta delta_from_json(const nlohmann::json& j);

nlohmann::json delta_to_json(const Delta& delta);

} // namespace chunkflow
