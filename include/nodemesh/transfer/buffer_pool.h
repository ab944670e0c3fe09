#ifndef NODEMESH_TRANSFER_BUFFER_POOL_H
#define NODEMESH_TRANSFER_BUFFER_POOL_H

#include <vector>
#include <mutex>
#include <cstdint>
#include <cstddef>

namespace nodemesh {

// Best-effort free list of fixed-size buffers. Never blocks: if the lock is
// contended or the list is empty a fresh buffer is allocated, and a buffer
// released into a full pool is dropped.
class BufferPool {
public:
    BufferPool(size_t buffer_size, size_t capacity);

    std::vector<uint8_t> acquire();
    void release(std::vector<uint8_t>&& buffer);

    size_t buffer_size() const { return buffer_size_; }
    size_t capacity() const { return capacity_; }
    size_t available() const;

private:
    size_t buffer_size_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::vector<uint8_t>> free_;
};

} // namespace nodemesh

#endif // NODEMESH_TRANSFER_BUFFER_POOL_H
