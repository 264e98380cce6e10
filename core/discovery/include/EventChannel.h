#pragma once

/**
 * @file EventChannel.h
 * @brief Closable multi-producer queue used as a session's event stream
 */

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace LanScout {

/**
 * @brief Unbounded FIFO with many writers and one reader.
 *
 * Once closed, pushes are rejected; the reader still drains what was queued
 * before the close and then sees end of stream. Items pushed by one thread
 * keep their relative order.
 */
template <typename T>
class EventChannel {
public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @return false if the channel is closed and the item was dropped
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Append a final batch and close in one step.
     *
     * No other producer can slip an item between the batch and the close.
     * @return false if the channel was already closed (batch dropped)
     */
    bool pushAndClose(std::vector<T> items) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            for (auto& item : items) {
                items_.push_back(std::move(item));
            }
            closed_ = true;
        }
        cv_.notify_all();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Block until an item is available.
     * @return std::nullopt once the channel is closed and drained
     */
    std::optional<T> next() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return popLocked();
    }

    /**
     * @brief Like next() but gives up after `timeout`.
     * @return std::nullopt on timeout or end of stream; check isClosed()
     *         to tell them apart.
     */
    template <typename Rep, typename Period>
    std::optional<T> nextFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return popLocked();
    }

    /// True when closed and nothing is left to read
    bool isDrained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace LanScout
