#pragma once

#include "ActionSink.hpp"
#include "Config.hpp"
#include "FingerClassifier.hpp"
#include "GestureClassifier.hpp"
#include "GestureHistory.hpp"
#include "History.hpp"
#include "ModeController.hpp"
#include "ScrollMomentum.hpp"
#include "Types.hpp"
#include "VolumeMapper.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace core {

/**
 * Output of one tick: at most one volume level and one scroll command,
 * plus everything the feedback renderer needs.
 */
struct TickResult {
    ControlMode mode = ControlMode::Idle;
    GestureLabel gesture = GestureLabel::Unknown;
    std::optional<FingerReading> reading;      // Empty when no usable hand
    std::optional<ModeTransition> transition;  // Set on the tick a mode was committed

    std::optional<float> volumeLevel;
    std::optional<int> scrollClicks;

    FeedbackState feedback;
};

/**
 * Gesture -> control pipeline for one hand
 *
 * Owns every piece of cross-tick state (mode hysteresis, histories,
 * volume smoothing, scroll momentum). One call to tick() per frame;
 * no I/O, never blocks.
 */
class GestureController {
public:
    using Clock = std::chrono::steady_clock;

    explicit GestureController(const ControllerConfig& config = getDefaultConfig());

    /**
     * Run one tick.
     * @param frame Landmarks of this tick, nullptr if no hand was detected.
     *              Frames with fewer than 21 landmarks count as no hand.
     * @param now Tick timestamp (wall clock, monotonic)
     */
    TickResult tick(const LandmarkFrame* frame, Clock::time_point now);

    /**
     * Convenience overload using frame.timestamp
     */
    TickResult tick(const LandmarkFrame& frame) { return tick(&frame, frame.timestamp); }

    [[nodiscard]] ControlMode getMode() const { return modeController_.getMode(); }
    [[nodiscard]] FeedbackState getFeedback() const { return feedback_; }

    [[nodiscard]] const ModeController& modeController() const { return modeController_; }
    [[nodiscard]] const GestureHistory& gestureHistory() const { return gestureHistory_; }
    [[nodiscard]] const BoundedHistory<float>& distanceHistory() const { return distanceHistory_; }
    [[nodiscard]] const VolumeMapper& volumeMapper() const { return volumeMapper_; }
    [[nodiscard]] const ScrollMomentum& scrollMomentum() const { return scrollMomentum_; }
    [[nodiscard]] const ControllerConfig& config() const { return config_; }

    /**
     * Back to the initial state (Idle, empty histories, no momentum)
     */
    void reset();

private:
    ControllerConfig config_;

    GestureClassifier gestureClassifier_;
    ModeController modeController_;
    GestureHistory gestureHistory_;
    BoundedHistory<float> distanceHistory_;
    VolumeMapper volumeMapper_;
    ScrollMomentum scrollMomentum_;

    FeedbackState feedback_;
    uint64_t tickCount_ = 0;
    uint64_t malformedFrames_ = 0;

    void enterMode(const ModeTransition& transition);
    void runVolume(TickResult& result);
    void runScroll(TickResult& result, Clock::time_point now);
    void updateFeedback(TickResult& result);
};

} // namespace core
