#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace core {

// ============================================================
// Landmark Model
// ============================================================

constexpr size_t LANDMARK_COUNT = 21;
constexpr size_t FINGER_COUNT = 5;

/**
 * Landmark indices based on the MediaPipe Hand Landmark model
 */
struct LandmarkIndices {
    static constexpr int WRIST = 0;

    // Thumb
    static constexpr int THUMB_CMC = 1;
    static constexpr int THUMB_MCP = 2;
    static constexpr int THUMB_IP = 3;
    static constexpr int THUMB_TIP = 4;

    // Index finger
    static constexpr int INDEX_MCP = 5;
    static constexpr int INDEX_PIP = 6;
    static constexpr int INDEX_DIP = 7;
    static constexpr int INDEX_TIP = 8;

    // Middle finger
    static constexpr int MIDDLE_MCP = 9;
    static constexpr int MIDDLE_PIP = 10;
    static constexpr int MIDDLE_DIP = 11;
    static constexpr int MIDDLE_TIP = 12;

    // Ring finger
    static constexpr int RING_MCP = 13;
    static constexpr int RING_PIP = 14;
    static constexpr int RING_DIP = 15;
    static constexpr int RING_TIP = 16;

    // Pinky
    static constexpr int PINKY_MCP = 17;
    static constexpr int PINKY_PIP = 18;
    static constexpr int PINKY_DIP = 19;
    static constexpr int PINKY_TIP = 20;
};

struct Landmark {
    float x = 0.0f;  // pixels
    float y = 0.0f;  // pixels, grows downwards
    float z = 0.0f;  // relative depth
};

/**
 * One detector output for one hand.
 * Anything with fewer than LANDMARK_COUNT points is treated as "no hand".
 */
struct LandmarkFrame {
    std::vector<Landmark> landmarks;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] bool isComplete() const { return landmarks.size() >= LANDMARK_COUNT; }

    // False if any coordinate is NaN or infinite
    [[nodiscard]] bool isFinite() const;
};

// ============================================================
// Classification Results
// ============================================================

enum class HandOrientation {
    Left,
    Right
};

// Positions inside FingerState
struct FingerIndex {
    static constexpr int THUMB = 0;
    static constexpr int INDEX = 1;
    static constexpr int MIDDLE = 2;
    static constexpr int RING = 3;
    static constexpr int PINKY = 4;
};

// Extended (true) / folded (false), ordered thumb -> pinky
using FingerState = std::array<bool, FINGER_COUNT>;

enum class GestureLabel {
    Fist = 0,       // All fingers folded, requests Idle
    ScrollUp = 1,   // Index only
    ScrollDown = 2, // Index + Middle
    Volume = 3,     // Thumb + Index, spread apart
    Unknown = 4     // Anything else, or no hand
};

enum class ControlMode {
    Idle = 0,
    Volume = 1,
    Scroll = 2
};

enum class ScrollDirection {
    Up,
    Down
};

struct ModeTransition {
    ControlMode from = ControlMode::Idle;
    ControlMode to = ControlMode::Idle;
};

const char* toString(GestureLabel label);
const char* toString(ControlMode mode);
const char* toString(HandOrientation orientation);

/**
 * Mode requested by a gesture. Unknown requests nothing.
 */
std::optional<ControlMode> targetModeFor(GestureLabel label);

} // namespace core
