#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace gossipnet {
namespace util {

/**
 * BoundedQueue - Thread-safe FIFO with a fixed capacity and a close flag
 *
 * Purpose:
 * - Inbound message queue behind every simulated listener
 * - Producers never block: TryPush fails when the queue is full or closed
 * - A single consumer blocks in Pop until an item arrives or Close() is called
 *
 * Usage:
 *   BoundedQueue<Message> queue(256);
 *   if (!queue.TryPush(msg)) { ... backpressure ... }
 *
 *   while (auto item = queue.Pop()) {   // returns std::nullopt once closed
 *     handle(*item);
 *   }
 *
 * Design decisions:
 * - Close() is terminal and idempotent; items still queued at close time are
 *   discarded so a closed consumer wakes immediately
 * - FIFO order is preserved per producer because every push happens under the
 *   same lock
 *
 * Template Parameters:
 * - T: Element type (must be movable)
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    enum class PushResult { Ok, Full, Closed };

    /**
     * Append an item without blocking
     * Returns Full if the queue holds `capacity` items, Closed after Close()
     */
    PushResult TryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (items_.size() >= capacity_) {
                return PushResult::Full;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return PushResult::Ok;
    }

    /**
     * Remove the oldest item, blocking while the queue is empty
     * Returns std::nullopt once the queue is closed
     */
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Non-blocking variant of Pop()
    std::optional<T> TryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            items_.clear();
        }
        not_empty_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace util
} // namespace gossipnet
