#include "core/FingerClassifier.hpp"
#include <cmath>

namespace core {

int FingerReading::extendedCount() const {
    int count = 0;
    for (bool extended : fingers) {
        count += extended ? 1 : 0;
    }
    return count;
}

std::optional<FingerReading> FingerClassifier::classify(const LandmarkFrame& frame) {
    if (!frame.isComplete() || !frame.isFinite()) {
        return std::nullopt;
    }

    using LI = LandmarkIndices;
    const auto& landmarks = frame.landmarks;

    FingerReading reading;
    reading.orientation = detectOrientation(landmarks);

    reading.fingers[FingerIndex::THUMB] = isThumbExtended(landmarks, reading.orientation);
    reading.fingers[FingerIndex::INDEX] = isFingerExtended(landmarks, LI::INDEX_TIP);
    reading.fingers[FingerIndex::MIDDLE] = isFingerExtended(landmarks, LI::MIDDLE_TIP);
    reading.fingers[FingerIndex::RING] = isFingerExtended(landmarks, LI::RING_TIP);
    reading.fingers[FingerIndex::PINKY] = isFingerExtended(landmarks, LI::PINKY_TIP);

    reading.thumbIndexDistance = distance2D(landmarks[LI::THUMB_TIP], landmarks[LI::INDEX_TIP]);
    reading.indexMiddleDistance = distance2D(landmarks[LI::INDEX_TIP], landmarks[LI::MIDDLE_TIP]);

    return reading;
}

HandOrientation FingerClassifier::detectOrientation(const std::vector<Landmark>& landmarks) {
    using LI = LandmarkIndices;
    // Palm facing the camera: a right hand has the pinky on the image's right side
    return landmarks[LI::PINKY_MCP].x > landmarks[LI::INDEX_MCP].x
               ? HandOrientation::Right
               : HandOrientation::Left;
}

bool FingerClassifier::isThumbExtended(const std::vector<Landmark>& landmarks,
                                       HandOrientation orientation) {
    // Thumb extends sideways, so compare X instead of Y.
    // Right hand: extended thumb tip sits LEFT of its IP joint (smaller X)
    // Left hand: mirrored
    using LI = LandmarkIndices;
    const auto& tip = landmarks[LI::THUMB_TIP];
    const auto& base = landmarks[LI::THUMB_IP];

    if (orientation == HandOrientation::Right) {
        return tip.x < base.x;
    }
    return tip.x > base.x;
}

bool FingerClassifier::isFingerExtended(const std::vector<Landmark>& landmarks, int tipIdx) {
    // Image Y grows downwards: tip above the PIP joint (tip - 2) means extended
    return landmarks[tipIdx].y < landmarks[tipIdx - 2].y;
}

float FingerClassifier::distance2D(const Landmark& a, const Landmark& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace core
