#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>

namespace core {

/**
 * Bounded FIFO of the most recent values.
 * Pushing into a full history evicts the oldest entry.
 * Capacity is fixed at construction (minimum 1).
 */
template<typename T>
class BoundedHistory {
public:
    explicit BoundedHistory(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    void push(const T& value) {
        if (values_.size() == capacity_) {
            values_.pop_front();
        }
        values_.push_back(value);
    }

    void clear() { values_.clear(); }

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] bool full() const { return values_.size() == capacity_; }

    // Oldest first
    [[nodiscard]] const T& operator[](size_t i) const { return values_[i]; }
    [[nodiscard]] const T& newest() const { return values_.back(); }
    [[nodiscard]] const T& oldest() const { return values_.front(); }

    [[nodiscard]] size_t count(const T& value) const {
        return static_cast<size_t>(std::count(values_.begin(), values_.end(), value));
    }

    /**
     * True if the last `n` entries all equal `value`.
     * False when fewer than `n` entries are recorded.
     */
    [[nodiscard]] bool endsWithRun(const T& value, size_t n) const {
        if (n == 0) return true;
        if (values_.size() < n) return false;
        return std::all_of(values_.end() - static_cast<std::ptrdiff_t>(n), values_.end(),
                           [&](const T& v) { return v == value; });
    }

    typename std::deque<T>::const_iterator begin() const { return values_.begin(); }
    typename std::deque<T>::const_iterator end() const { return values_.end(); }

private:
    size_t capacity_;
    std::deque<T> values_;
};

} // namespace core
