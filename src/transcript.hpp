#pragma once
#include "delta.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace chunkflow {

// Callback receives each decoded delta. Return false to stop reading.
using DeltaCallback = std::function<bool(const Delta& delta)>;

// Incremental reader for recorded model streams.
//
// Accepts SSE ("data: {...}" lines, dispatched on a blank line) and JSON lines
// (one delta or chunk object per line), mixed freely. A "[DONE]" payload ends
// the transcript; input after it is ignored.
class TranscriptReader {
public:
    // Feed raw data; complete lines are decoded and passed to callback
    void feed(const std::string& chunk, const DeltaCallback& callback);

    // End of input: decode a trailing unterminated line and pending SSE data
    void finish(const DeltaCallback& callback);

    bool done() const { return done_; }
    uint32_t deltas_read() const { return deltas_read_; }
    uint32_t malformed_lines() const { return malformed_; }

    void reset();

private:
    bool handle_line(std::string line, const DeltaCallback& callback);
    bool dispatch_data(const DeltaCallback& callback);
    bool dispatch_payload(const std::string& payload, const DeltaCallback& callback);

    std::string buffer_;
    std::string pending_data_;
    bool done_ = false;
    bool stopped_ = false;
    uint32_t deltas_read_ = 0;
    uint32_t malformed_ = 0;
};

} // namespace chunkflow
