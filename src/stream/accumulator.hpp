#pragma once
#include <string>
#include <vector>

namespace chunkflow {

// Raw and sanitized text of one round. Raw is appended as received; the
// sanitized view is kept as fragments and joined lazily on read.
class ContentAccumulator {
public:
    void append_raw(const std::string& fragment) { raw_ += fragment; }
    void append_sanitized(std::string fragment);

    const std::string& raw() const { return raw_; }
    const std::string& sanitized() const;

    void clear();

private:
    std::string raw_;
    std::vector<std::string> parts_;
    mutable std::string joined_;
    mutable bool dirty_ = false;
};

} // namespace chunkflow
