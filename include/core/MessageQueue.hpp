#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace core {

/**
 * Bounded multi-producer / single-consumer queue.
 *
 * Producers never block: tryPush fails when the queue is full or closed.
 * The consumer blocks in pop() / popFor() until an item arrives or the queue
 * is closed and drained.
 *
 * @tparam T Message type (moved in and out)
 */
template<typename T>
class MessageQueue {
public:
    explicit MessageQueue(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

    // Non-copyable
    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /**
     * Enqueue without blocking.
     * Returns false if the queue is full or closed.
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * Enqueue ignoring capacity (control messages such as a stop request).
     * Returns false only if the queue is closed.
     */
    bool pushUrgent(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * Block until an item is available.
     * Returns std::nullopt once the queue is closed and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        return takeFront();
    }

    /**
     * Like pop(), but gives up after `timeout`.
     */
    template<typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return takeFront();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront();
    }

    /**
     * Reject further pushes and wake the consumer. Queued items can still be popped.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

private:
    // Caller holds mutex_
    std::optional<T> takeFront() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace core
