#include "core/GestureController.hpp"
#include "core/Logger.hpp"
#include <cmath>

namespace core {

GestureController::GestureController(const ControllerConfig& config)
    : config_(config),
      gestureClassifier_(config.gesture),
      modeController_(config.gesture.commitThreshold),
      gestureHistory_(config.history.gestureHistorySize),
      distanceHistory_(config.history.distanceHistorySize),
      volumeMapper_(config.volume),
      scrollMomentum_(config.scroll) {
}

void GestureController::reset() {
    modeController_.reset();
    gestureHistory_.clear();
    distanceHistory_.clear();
    volumeMapper_.reset();
    scrollMomentum_.reset();
    feedback_ = FeedbackState{};
    tickCount_ = 0;
    malformedFrames_ = 0;
}

TickResult GestureController::tick(const LandmarkFrame* frame, Clock::time_point now) {
    tickCount_++;
    TickResult result;

    if (frame) {
        result.reading = FingerClassifier::classify(*frame);
        if (!result.reading && !frame->landmarks.empty()) {
            // Malformed frames degrade to "no hand"
            malformedFrames_++;
            Logger::debug("GestureController: malformed frame with ", frame->landmarks.size(),
                          " landmarks (", malformedFrames_, " total)");
        }
    }

    if (result.reading) {
        const FingerReading& reading = *result.reading;
        distanceHistory_.push(reading.thumbIndexDistance);
        result.gesture = gestureClassifier_.classify(reading.fingers, reading.thumbIndexDistance);

        // Debug log (every 60 ticks)
        if (tickCount_ % 60 == 1) {
            const auto& f = reading.fingers;
            Logger::debug("Fingers: T=", f[FingerIndex::THUMB], " I=", f[FingerIndex::INDEX],
                          " M=", f[FingerIndex::MIDDLE], " R=", f[FingerIndex::RING],
                          " P=", f[FingerIndex::PINKY], " hand=", toString(reading.orientation),
                          " pinch=", reading.thumbIndexDistance, " -> ", toString(result.gesture));
        }
    }

    gestureHistory_.push(result.gesture);

    result.transition = modeController_.observe(result.gesture);
    if (result.transition) {
        enterMode(*result.transition);
    }
    result.mode = modeController_.getMode();

    switch (result.mode) {
        case ControlMode::Volume:
            runVolume(result);
            break;
        case ControlMode::Scroll:
            runScroll(result, now);
            break;
        case ControlMode::Idle:
            // Momentum is cleared on mode entry; nothing can coast here
            break;
    }

    updateFeedback(result);
    return result;
}

void GestureController::enterMode(const ModeTransition& transition) {
    // Mode-specific state starts empty on every entry
    distanceHistory_.clear();
    volumeMapper_.reset();
    scrollMomentum_.reset();

    Logger::debug("GestureController: entered ", toString(transition.to),
                  " (smoothing and momentum reset)");
}

void GestureController::runVolume(TickResult& result) {
    if (!result.reading) return;

    // Fist / Scroll postures are on their way out of Volume mode: hold the level.
    // Unknown covers a closed pinch, which must still reach the minimum.
    if (result.gesture != GestureLabel::Volume && result.gesture != GestureLabel::Unknown) {
        return;
    }

    result.volumeLevel = volumeMapper_.update(result.reading->thumbIndexDistance, distanceHistory_);
}

void GestureController::runScroll(TickResult& result, Clock::time_point now) {
    std::optional<ScrollDirection> direction;
    if (result.gesture == GestureLabel::ScrollUp) {
        direction = ScrollDirection::Up;
    } else if (result.gesture == GestureLabel::ScrollDown) {
        direction = ScrollDirection::Down;
    }

    float fingerDistance = result.reading ? result.reading->indexMiddleDistance : 0.0f;
    result.scrollClicks = scrollMomentum_.update(direction, fingerDistance, now);
}

void GestureController::updateFeedback(TickResult& result) {
    feedback_.mode = result.mode;
    feedback_.gesture = result.gesture;
    feedback_.confidence = modeController_.getConfidence();
    feedback_.stability = gestureHistory_.stabilityOf(result.gesture);

    switch (result.mode) {
        case ControlMode::Volume:
            feedback_.value = volumeMapper_.toPercent(volumeMapper_.getLastLevel());
            break;
        case ControlMode::Scroll:
            feedback_.value = std::abs(scrollMomentum_.getMomentum());
            break;
        case ControlMode::Idle:
            feedback_.value = 0.0f;
            break;
    }

    result.feedback = feedback_;
}

} // namespace core
