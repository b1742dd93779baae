#include "core/GestureClassifier.hpp"

namespace core {

GestureLabel GestureClassifier::classify(const FingerState& fingers, float thumbIndexDistance) const {
    const bool thumbUp = fingers[FingerIndex::THUMB];
    const bool indexUp = fingers[FingerIndex::INDEX];
    const bool middleUp = fingers[FingerIndex::MIDDLE];
    const bool ringUp = fingers[FingerIndex::RING];
    const bool pinkyUp = fingers[FingerIndex::PINKY];

    // FIST: all fingers down, distances irrelevant
    if (!thumbUp && !indexUp && !middleUp && !ringUp && !pinkyUp) {
        return GestureLabel::Fist;
    }

    // SCROLL: index only (up) or index + middle (down)
    if (!thumbUp && indexUp && !ringUp && !pinkyUp) {
        return middleUp ? GestureLabel::ScrollDown : GestureLabel::ScrollUp;
    }

    // VOLUME: thumb + index, spread wide enough not to be a closed pinch
    if (thumbUp && indexUp && !middleUp && !ringUp && !pinkyUp) {
        if (thumbIndexDistance > config_.minVolumePinch) {
            return GestureLabel::Volume;
        }
        return GestureLabel::Unknown;
    }

    if (config_.pinkyExitsMode && pinkyUp) {
        return GestureLabel::Fist;
    }

    // Ambiguous - the mode controller keeps its current mode
    return GestureLabel::Unknown;
}

} // namespace core
