/**
 * @file event_queue.hpp
 * @brief Bounded, coalescing thread-safe queue
 *
 * Hands events from transfer workers to a consumer thread (a UI loop, the
 * demo host) without letting a slow consumer grow memory without bound.
 *
 * EXAMPLE:
 * ThreadSafeQueue<Message> queue(64);
 * queue.push_coalesced(msg, is_progress);   // producer
 * auto next = queue.pop_for(100ms);         // consumer
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ingest::events {

/**
 * @brief Thread-safe FIFO queue with an optional soft capacity
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers
 * - pop()/pop_for() block on a condition variable
 *
 * CAPACITY:
 * When full, push_coalesced() evicts the oldest item matching its
 * predicate. If nothing matches, the item is still queued; only
 * replaceable items are ever dropped.
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Push, replacing the newest item if it is also replaceable
     *
     * @param replaceable Predicate(const T&) marking items that may be
     *                    superseded by a newer one (progress snapshots)
     * @return Number of queued items dropped to make room
     */
    template<typename Predicate>
    std::size_t push_coalesced(T item, Predicate replaceable) {
        std::size_t dropped = 0;
        {
            std::unique_lock lock(mutex_);
            if (replaceable(item) && !queue_.empty() && replaceable(queue_.back())) {
                queue_.back() = std::move(item);
                ++dropped;
            } else {
                if (capacity_ > 0 && queue_.size() >= capacity_) {
                    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
                        if (replaceable(*it)) {
                            queue_.erase(it);
                            ++dropped;
                            break;
                        }
                    }
                }
                queue_.push_back(std::move(item));
            }
        }
        cv_.notify_one();
        return dropped;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /// Blocks until an item arrives or shutdown() is called.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::unique_lock lock(mutex_);
        shutdown_ = false;
    }

private:
    std::deque<T> queue_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace ingest::events
