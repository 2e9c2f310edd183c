#include "tool_call_builder.hpp"

namespace chunkflow {

std::optional<ToolCall> ToolCallBuilder::merge(const ToolCallFragment& fragment) {
    auto& entry = calls_[fragment.index];
    entry.index = fragment.index;

    // First non-empty id wins
    if (entry.id.empty() && fragment.id && !fragment.id->empty()) {
        entry.id = *fragment.id;
    }
    if (fragment.name) {
        entry.name += *fragment.name;
    }
    if (fragment.arguments) {
        entry.arguments += *fragment.arguments;
    }

    if (entry.name.empty()) return std::nullopt;
    return entry;
}

std::vector<ToolCall> ToolCallBuilder::calls() const {
    std::vector<ToolCall> out;
    out.reserve(calls_.size());
    for (const auto& [idx, tc] : calls_) {
        out.push_back(tc);
    }
    return out;
}

} // namespace chunkflow
