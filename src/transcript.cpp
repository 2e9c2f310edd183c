#include "transcript.hpp"
#include "util.hpp"
#include <iostream>

namespace chunkflow {

void TranscriptReader::feed(const std::string& chunk, const DeltaCallback& callback) {
    if (done_ || stopped_) return;
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            // Incomplete line - keep remainder in buffer
            buffer_ = buffer_.substr(pos);
            return;
        }

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;

        if (!handle_line(std::move(line), callback)) {
            buffer_.clear();
            return;
        }
    }

    buffer_.clear();
}

void TranscriptReader::finish(const DeltaCallback& callback) {
    if (done_ || stopped_) return;
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!handle_line(std::move(line), callback)) return;
    }
    dispatch_data(callback);
}

bool TranscriptReader::handle_line(std::string line, const DeltaCallback& callback) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Empty line = dispatch SSE event
        return dispatch_data(callback);
    }

    if (line.rfind("data:", 0) == 0) {
        if (!pending_data_.empty()) {
            pending_data_ += '\n';
        }
        pending_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        return true;
    }

    // SSE fields we have no use for, and comments
    if (line[0] == ':' || line.rfind("event:", 0) == 0 ||
        line.rfind("id:", 0) == 0 || line.rfind("retry:", 0) == 0) {
        return true;
    }

    std::string bare = trim(line);
    if (bare.empty()) return dispatch_data(callback);
    return dispatch_payload(bare, callback);
}

bool TranscriptReader::dispatch_data(const DeltaCallback& callback) {
    if (pending_data_.empty()) return true;
    std::string payload;
    payload.swap(pending_data_);
    return dispatch_payload(trim(payload), callback);
}

bool TranscriptReader::dispatch_payload(const std::string& payload,
                                        const DeltaCallback& callback) {
    if (payload == "[DONE]") {
        done_ = true;
        pending_data_.clear();
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        ++malformed_;
        std::cerr << "[chunkflow] Skipping malformed transcript line: "
                  << payload.substr(0, 80) << "\n";
        return true;
    }

    ++deltas_read_;
    if (!callback(delta_from_json(j))) {
        stopped_ = true;
        return false;
    }
    return true;
}

void TranscriptReader::reset() {
    buffer_.clear();
    pending_data_.clear();
    done_ = false;
    stopped_ = false;
    deltas_read_ = 0;
    malformed_ = 0;
}

} // namespace chunkflow
