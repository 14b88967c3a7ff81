#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <atomic>

namespace core {

// A single-producer single-consumer lock-free ring buffer.
// The producer side never blocks and never allocates, so it is safe to call
// from an audio capture callback.
template <typename T>
class SpscRingBuffer {
public:
    explicit SpscRingBuffer(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    size_t capacity() const { return capacity_; }

    // All-or-nothing push: writes n items only if they all fit.
    // Returns false (and writes nothing) when there is not enough room.
    bool try_push(const T* data, size_t n) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);
        size_t free_space = capacity_ - (head - tail);
        if (n > free_space) {
            dropped_.fetch_add(n, std::memory_order_relaxed);
            return false;
        }
        for (size_t i = 0; i < n; ++i) {
            buffer_[(head + i) % capacity_] = data[i];
        }
        head_.store(head + n, std::memory_order_release);
        return true;
    }

    // Pop up to n items, returns items actually read.
    size_t pop(T* out, size_t n) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t to_read = (n < available) ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer side only. Discards everything currently readable.
    void clear() {
        tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

    // Items rejected by try_push because the buffer was full.
    size_t dropped_count() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
    std::atomic<size_t> dropped_{0};
};

} // namespace core
