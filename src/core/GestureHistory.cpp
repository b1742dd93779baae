#include "core/GestureHistory.hpp"
#include <array>

namespace core {

float GestureHistory::stabilityOf(GestureLabel label) const {
    if (labels_.empty()) return 0.0f;
    return static_cast<float>(labels_.count(label)) / static_cast<float>(labels_.size());
}

GestureLabel GestureHistory::dominant() const {
    if (labels_.empty()) return GestureLabel::Unknown;

    std::array<size_t, 5> counts{};
    for (GestureLabel label : labels_) {
        counts[static_cast<size_t>(label)]++;
    }

    // Walk newest -> oldest so ties go to the most recent label
    GestureLabel best = labels_.newest();
    for (size_t i = labels_.size(); i-- > 0;) {
        GestureLabel candidate = labels_[i];
        if (counts[static_cast<size_t>(candidate)] > counts[static_cast<size_t>(best)]) {
            best = candidate;
        }
    }
    return best;
}

} // namespace core
