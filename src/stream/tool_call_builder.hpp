#pragma once
#include "../delta.hpp"
#include "../stream_event.hpp"
#include <map>
#include <optional>
#include <vector>

namespace chunkflow {

// Reassembles streamed tool calls from index-addressed fragments.
// Records are keyed by the fragment index, never by arrival position.
class ToolCallBuilder {
public:
    // Merge one fragment. Returns the cumulative record once its name is
    // non-empty, nullopt while the call is still anonymous.
    std::optional<ToolCall> merge(const ToolCallFragment& fragment);

    bool empty() const { return calls_.empty(); }
    size_t size() const { return calls_.size(); }

    // Records in ascending index order
    std::vector<ToolCall> calls() const;

    void clear() { calls_.clear(); }

private:
    std::map<int, ToolCall> calls_;
};

} // namespace chunkflow
