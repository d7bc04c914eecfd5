#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

/**
 * Bounded multi-producer/multi-consumer queue
 *
 * - push() blocks while full (backpressure)
 * - pop() blocks while empty
 * - close() wakes everyone; pending items can still be drained
 */
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity)
        : capacity_(capacity > 0 ? capacity : 1)
        , closed_(false)
    {}

    // Non-copyable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * Returns false if the channel was closed before the item could be queued
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_not_full_.wait(lock, [this]() {
            return queue_.size() < capacity_ || closed_;
        });
        if (closed_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_not_empty_.notify_one();
        return true;
    }

    /**
     * Next item, blocking until one arrives.
     * Returns std::nullopt once the channel is closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_not_empty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return takeLocked();
    }

    /**
     * Like pop() but gives up after timeout
     */
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        });
        return takeLocked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_not_empty_.notify_all();
        cv_not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t freeSlots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() >= capacity_ ? 0 : capacity_ - queue_.size();
    }

private:
    std::optional<T> takeLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        cv_not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    bool closed_;
    mutable std::mutex mutex_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;
    std::queue<T> queue_;
};
