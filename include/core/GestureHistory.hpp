#pragma once

#include "Types.hpp"
#include "History.hpp"

namespace core {

/**
 * Recent gesture labels, read-only stability queries for feedback and logging.
 * Mode decisions use the ModeController counter, not this buffer.
 */
class GestureHistory {
public:
    explicit GestureHistory(size_t capacity) : labels_(capacity) {}

    void push(GestureLabel label) { labels_.push(label); }
    void clear() { labels_.clear(); }

    [[nodiscard]] size_t size() const { return labels_.size(); }
    [[nodiscard]] size_t capacity() const { return labels_.capacity(); }

    /**
     * Fraction (0-1) of the recorded labels equal to `label`
     */
    [[nodiscard]] float stabilityOf(GestureLabel label) const;

    /**
     * Most frequent label; ties resolve to the most recent one.
     * Unknown when empty.
     */
    [[nodiscard]] GestureLabel dominant() const;

    /**
     * True if the last `n` labels are all `label`
     */
    [[nodiscard]] bool isStable(GestureLabel label, size_t n) const { return labels_.endsWithRun(label, n); }

    [[nodiscard]] const BoundedHistory<GestureLabel>& labels() const { return labels_; }

private:
    BoundedHistory<GestureLabel> labels_;
};

} // namespace core
