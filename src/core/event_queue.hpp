#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <atomic>

namespace core {

// Bounded thread-safe queue feeding a single consumer loop.
// Design: producers (channel/network threads) never block. When the queue is
//         full the new item is rejected and counted, the consumer keeps
//         draining in arrival order.
//         stop() wakes the consumer and discards whatever is still queued.
template <typename T>
class EventQueue {
public:
    explicit EventQueue(size_t max_size = 1024) : max_size_(max_size) {}

    // Push an item (called from producer threads). Never blocks.
    // Returns false if the queue is stopped or full.
    bool push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return false;
            }
            if (queue_.size() >= max_size_) {
                dropped_count_++;
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_pop_.notify_one();
        return true;
    }

    // Pop an item (called by the consumer loop). Blocks until an item is
    // available or the queue is stopped. Returns false once stopped.
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (stopped_) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Signal stop: no more pushes accepted, pending items are discarded.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            queue_.clear();
        }
        cv_pop_.notify_all();
    }

    bool is_stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t dropped_count() const {
        return dropped_count_.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::deque<T> queue_;
    size_t max_size_;
    bool stopped_ = false;
    std::atomic<size_t> dropped_count_{0};
};

} // namespace core
