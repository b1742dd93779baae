#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace core {

/**
 * Thresholds and ranges for the gesture -> control pipeline.
 * Distances are in pixels of the landmark frame space (640x480 by default).
 * Values are empirical; presets below cover the common setups.
 */
struct GestureConfig {
    // Thumb-index separation required for the Volume gesture.
    // Below this the pose reads as a closed pinch, not a Volume request.
    float minVolumePinch = 30.0f;

    // Ticks of identical evidence before a mode is committed (~83ms @ 60fps)
    int commitThreshold = 5;

    // Treat any otherwise-unknown pose with the pinky up as Fist
    bool pinkyExitsMode = false;
};

struct VolumeConfig {
    float handRangeMin = 50.0f;    // Pinch distance mapped to minimum level
    float handRangeMax = 200.0f;   // Pinch distance mapped to maximum level
    float levelMin = 0.0f;         // Executor's valid range
    float levelMax = 1.0f;
    float instantWeight = 0.7f;    // Remainder goes to the historical mean
};

struct ScrollConfig {
    float distanceMin = 30.0f;     // Index-middle tip distance for slowest scroll
    float distanceMax = 200.0f;    // ... and for fastest scroll
    float speedMin = 1.0f;         // Clicks per emission
    float speedMax = 20.0f;

    std::chrono::milliseconds cooldown{50};        // Between fresh emissions
    std::chrono::milliseconds adaptiveGap{500};    // Longer pause resets adaptive speed
    float adaptiveGrowth = 1.01f;                  // Per active tick
    float adaptiveMax = 1.5f;

    float momentumThreshold = 0.1f;  // Below this momentum snaps to zero
    float decaySlow = 0.97f;         // Decay per reference tick at speedMax
    float decayFast = 0.90f;         // Decay per reference tick at speedMin
    std::chrono::microseconds referenceTick{16667}; // Nominal 60 fps
};

struct HistoryConfig {
    size_t gestureHistorySize = 8;
    size_t distanceHistorySize = 10;
};

struct ControllerConfig {
    GestureConfig gesture;
    VolumeConfig volume;
    ScrollConfig scroll;
    HistoryConfig history;

    /**
     * Check ranges and ratios.
     * @return Human-readable problems, empty if the config is usable
     */
    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * Default configuration
 * Webcam at 640x480, hand at 40-80cm, normalized volume output
 */
ControllerConfig getDefaultConfig();

/**
 * Faster mode switching and snappier scroll, for high frame rate cameras
 */
ControllerConfig getResponsiveConfig();

/**
 * Output in decibels (-63.5dB .. 0dB), for endpoint volume APIs
 */
ControllerConfig getDecibelVolumeConfig();

} // namespace core
