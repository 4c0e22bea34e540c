#include "tail_buffer.h"
#include <algorithm>

namespace nanoflow::utils {

TailBuffer::TailBuffer(size_t capacity)
    : buffer_(std::max<size_t>(capacity, 1)) {
}

void TailBuffer::append(const char* data, size_t size) {
    total_ += size;

    const size_t cap = buffer_.size();
    if (size >= cap) {
        // Only the last cap bytes survive
        std::copy(data + (size - cap), data + size, buffer_.begin());
        start_ = 0;
        size_ = cap;
        return;
    }

    for (size_t i = 0; i < size; ++i) {
        size_t pos = (start_ + size_) % cap;
        buffer_[pos] = data[i];
        if (size_ < cap) {
            ++size_;
        } else {
            start_ = (start_ + 1) % cap;
        }
    }
}

std::string TailBuffer::str() const {
    std::string out;
    out.reserve(size_);
    const size_t cap = buffer_.size();
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(buffer_[(start_ + i) % cap]);
    }
    return out;
}

} // namespace nanoflow::utils
