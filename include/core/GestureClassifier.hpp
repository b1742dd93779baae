#pragma once

#include "Config.hpp"
#include "Types.hpp"

namespace core {

/**
 * Maps a finger-state vector (plus pinch distance) to a gesture label.
 *
 * Rules, first match wins:
 *   1. all folded                                  -> Fist
 *   2. index only / index + middle                 -> ScrollUp / ScrollDown
 *   3. thumb + index, pinch wider than the gate    -> Volume
 *   4. pinky up (only if pinkyExitsMode)           -> Fist
 *   5. anything else                               -> Unknown
 */
class GestureClassifier {
public:
    explicit GestureClassifier(const GestureConfig& config) : config_(config) {}

    [[nodiscard]] GestureLabel classify(const FingerState& fingers, float thumbIndexDistance) const;

    [[nodiscard]] const GestureConfig& config() const { return config_; }

private:
    GestureConfig config_;
};

} // namespace core
