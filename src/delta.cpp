#include "delta.hpp"
#include <cstdint>
#include <limits>

namespace chunkflow {

using json = nlohmann::json;

static std::optional<std::string> string_field(const json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<ToolCallFragment> parse_fragment(const json& tc) {
    ToolCallFragment frag;
    if (tc.contains("index") && tc["index"].is_number_unsigned()) {
        uint64_t index = tc["index"].get<uint64_t>();
        if (index > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        frag.index = static_cast<int>(index);
    } else if (tc.contains("index") && tc["index"].is_number_integer()) {
        int64_t index = tc["index"].get<int64_t>();
        if (index < std::numeric_limits<int>::min()) return std::nullopt;
        frag.index = static_cast<int>(index);
    }
    frag.id = string_field(tc, "id");

    const json& fn = tc.contains("function") && tc["function"].is_object()
                         ? tc["function"] : tc;
    frag.name = string_field(fn, "name");
    frag.arguments = string_field(fn, "arguments");
    return frag;
}

Delta delta_from_json(const json& j) {
    Delta delta;
    if (!j.is_object()) return delta;

    const json* body = &j;
    if (j.contains("choices")) {
        const auto& choices = j["choices"];
        if (!choices.is_array() || choices.empty()) return delta;
        const auto& choice = choices[0];
        if (!choice.is_object() || !choice.contains("delta") ||
            !choice["delta"].is_object()) {
            return delta;
        }
        body = &choice["delta"];
    }

    delta.content = string_field(*body, "content");

    if (body->contains("tool_calls") && (*body)["tool_calls"].is_array()) {
        for (const auto& tc : (*body)["tool_calls"]) {
            if (!tc.is_object()) continue;
            if (auto frag = parse_fragment(tc)) {
                delta.tool_calls.push_back(std::move(*frag));
            }
        }
    }

    return delta;
}

json delta_to_json(const Delta& delta) {
    json j = json::object();
    if (delta.content) {
        j["content"] = *delta.content;
    }
    if (!delta.tool_calls.empty()) {
        json arr = json::array();
        for (const auto& frag : delta.tool_calls) {
            json tc;
            tc["index"] = frag.index;
            if (frag.id) tc["id"] = *frag.id;
            json fn = json::object();
            if (frag.name) fn["name"] = *frag.name;
            if (frag.arguments) fn["arguments"] = *frag.arguments;
            tc["function"] = fn;
            arr.push_back(tc);
        }
        j["tool_calls"] = arr;
    }
    return j;
}

} // namespace chunkflow
