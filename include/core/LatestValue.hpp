#pragma once

#include <cstddef>
#include <mutex>
#include <optional>

namespace core {

/**
 * Single-slot mailbox between a producer thread and one consumer.
 * The newest value wins: publishing overwrites whatever the consumer has
 * not taken yet, so a slow consumer never sees a backlog of stale frames.
 *
 * @tparam T Value type (copied/moved in and out under the lock)
 */
template<typename T>
class LatestValue {
public:
    LatestValue() = default;

    // Non-copyable
    LatestValue(const LatestValue&) = delete;
    LatestValue& operator=(const LatestValue&) = delete;

    /**
     * Store a value, replacing any unconsumed one.
     * @return true if an unconsumed value was dropped
     */
    bool publish(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool dropped = value_.has_value();
        value_ = std::move(value);
        if (dropped) {
            dropped_++;
        }
        return dropped;
    }

    /**
     * Take the current value, leaving the slot empty.
     * Returns std::nullopt if nothing new was published.
     */
    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> out = std::move(value_);
        value_.reset();
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !value_.has_value();
    }

    /**
     * Number of values overwritten before the consumer took them
     */
    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<T> value_;
    size_t dropped_ = 0;
};

} // namespace core
