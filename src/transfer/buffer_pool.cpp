#include "nodemesh/transfer/buffer_pool.h"
#include <algorithm>

namespace nodemesh {

BufferPool::BufferPool(size_t buffer_size, size_t capacity)
    : buffer_size_(buffer_size), capacity_(capacity) {
    free_.reserve(capacity_);
    for (size_t i = 0; i < capacity_; ++i) {
        free_.emplace_back(buffer_size_, 0);
    }
}

std::vector<uint8_t> BufferPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (lock.owns_lock() && !free_.empty()) {
        auto buffer = std::move(free_.back());
        free_.pop_back();
        return buffer;
    }
    return std::vector<uint8_t>(buffer_size_, 0);
}

void BufferPool::release(std::vector<uint8_t>&& buffer) {
    // Reset before the lock is taken
    buffer.resize(buffer_size_);
    std::fill(buffer.begin(), buffer.end(), 0);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (lock.owns_lock() && free_.size() < capacity_) {
        free_.push_back(std::move(buffer));
    }
}

size_t BufferPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

} // namespace nodemesh
