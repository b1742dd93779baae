#pragma once

#include "Types.hpp"
#include <optional>

namespace core {

/**
 * Per-tick reading of one hand: which digits are extended plus the
 * fingertip distances the downstream stages consume.
 */
struct FingerReading {
    FingerState fingers{};
    HandOrientation orientation = HandOrientation::Right;
    float thumbIndexDistance = 0.0f;   // Pinch distance (pixels)
    float indexMiddleDistance = 0.0f;  // Scroll speed input (pixels)

    [[nodiscard]] int extendedCount() const;
};

/**
 * Finger-state classification
 *
 * Y-based test for the four fingers (tip above the joint two segments below
 * it = extended) and X-based test for the thumb, mirrored by hand orientation.
 * Pure functions, no state.
 */
class FingerClassifier {
public:
    /**
     * Classify a landmark frame.
     * @return std::nullopt if the frame has fewer than 21 landmarks
     */
    [[nodiscard]] static std::optional<FingerReading> classify(const LandmarkFrame& frame);

    /**
     * Right hand when the pinky base lies to the right of the index base in image space
     */
    [[nodiscard]] static HandOrientation detectOrientation(const std::vector<Landmark>& landmarks);

    [[nodiscard]] static bool isThumbExtended(const std::vector<Landmark>& landmarks,
                                              HandOrientation orientation);

    [[nodiscard]] static bool isFingerExtended(const std::vector<Landmark>& landmarks, int tipIdx);

    [[nodiscard]] static float distance2D(const Landmark& a, const Landmark& b);
};

} // namespace core
