#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace nanoflow::utils {

// Fixed-capacity ring buffer keeping the last N bytes of a stream.
// Memory stays bounded no matter how much a child process writes.
class TailBuffer {
public:
    explicit TailBuffer(size_t capacity);

    void append(const char* data, size_t size);
    void append(const std::string& data) { append(data.data(), data.size()); }

    // Buffered bytes, oldest first
    std::string str() const;

    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }

    // Bytes seen in total, including those already overwritten
    size_t total_bytes() const { return total_; }
    bool truncated() const { return total_ > size_; }

private:
    std::vector<char> buffer_;
    size_t start_ = 0;
    size_t size_ = 0;
    size_t total_ = 0;
};

} // namespace nanoflow::utils
