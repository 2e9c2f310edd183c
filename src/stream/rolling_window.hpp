#pragma once
#include <cstddef>
#include <vector>

namespace chunkflow {

// Fixed-capacity FIFO of the most recent samples. Storage is allocated once;
// pushing into a full window overwrites the oldest sample.
template<typename T>
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity) {}

    void push(const T& value) {
        buffer_[head_] = value;
        head_ = (head_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) ++size_;
    }

    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return size_ == 0; }

    // Samples oldest first
    std::vector<T> values() const {
        std::vector<T> out;
        out.reserve(size_);
        size_t start = (head_ + buffer_.size() - size_) % buffer_.size();
        for (size_t i = 0; i < size_; ++i) {
            out.push_back(buffer_[(start + i) % buffer_.size()]);
        }
        return out;
    }

    T sum() const {
        T total{};
        for (size_t i = 0; i < size_; ++i) {
            total += buffer_[i];
        }
        return total;
    }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> buffer_;
    size_t head_ = 0;
    size_t size_ = 0;
};

} // namespace chunkflow
