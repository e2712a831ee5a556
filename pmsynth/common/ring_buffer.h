#pragma once

#include <atomic>
#include <cstdint>

namespace common {

// Single-producer/single-consumer ring buffer for small messages.
// Not thread-safe for multiple producers or multiple consumers.
// Push() and Pop() never block and never allocate.
template <typename T, uint32_t kCapacity>
class RingBuffer {
  static_assert(kCapacity > 0 && (kCapacity & (kCapacity - 1)) == 0,
                "capacity must be a power of two");

 public:
  RingBuffer() : write_pos_(0), read_pos_(0) {}

  // Returns false if full
  bool Push(const T& item) {
    const uint32_t write = write_pos_.load(std::memory_order_relaxed);
    const uint32_t read = read_pos_.load(std::memory_order_acquire);
    if (write - read >= kCapacity) {
      return false;
    }
    items_[write & kMask] = item;
    write_pos_.store(write + 1, std::memory_order_release);
    return true;
  }

  // Returns false if empty
  bool Pop(T* out_item) {
    const uint32_t read = read_pos_.load(std::memory_order_relaxed);
    const uint32_t write = write_pos_.load(std::memory_order_acquire);
    if (read == write) {
      return false;
    }
    *out_item = items_[read & kMask];
    read_pos_.store(read + 1, std::memory_order_release);
    return true;
  }

  // Number of items available to pop
  uint32_t Size() const {
    return write_pos_.load(std::memory_order_acquire) -
           read_pos_.load(std::memory_order_acquire);
  }

  static constexpr uint32_t Capacity() { return kCapacity; }

 private:
  static constexpr uint32_t kMask = kCapacity - 1;

  T items_[kCapacity];
  std::atomic<uint32_t> write_pos_;
  std::atomic<uint32_t> read_pos_;

  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;
};

}  // namespace common
