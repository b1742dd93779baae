#include "core/ModeController.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace core {

ModeController::ModeController(int commitThreshold)
    : commitThreshold_(std::max(commitThreshold, 1)) {
    reset();
}

void ModeController::reset() {
    mode_ = ControlMode::Idle;
    pendingMode_.reset();
    stabilityCounter_ = 0;
}

float ModeController::getConfidence() const {
    if (!pendingMode_ || *pendingMode_ == mode_) {
        return 1.0f;  // Stable state
    }
    // Transitioning - return progress through the stability window
    return static_cast<float>(stabilityCounter_) / static_cast<float>(commitThreshold_);
}

std::optional<ModeTransition> ModeController::observe(GestureLabel label) {
    std::optional<ControlMode> target = targetModeFor(label);
    if (!target) {
        // No observation: keep candidate and counter as they are
        return std::nullopt;
    }

    if (pendingMode_ != target) {
        // New candidate restarts the stability clock; this tick is its first sighting
        pendingMode_ = target;
        stabilityCounter_ = 1;
    } else if (stabilityCounter_ < commitThreshold_) {
        stabilityCounter_++;
    }

    if (stabilityCounter_ >= commitThreshold_ && *pendingMode_ != mode_) {
        return transitionTo(*pendingMode_);
    }

    return std::nullopt;
}

ModeTransition ModeController::transitionTo(ControlMode newMode) {
    ModeTransition transition{mode_, newMode};
    mode_ = newMode;

    Logger::info("ModeController: ", toString(transition.from), " → ", toString(transition.to));

    if (transitionCallback_) {
        transitionCallback_(transition.from, transition.to);
    }
    return transition;
}

} // namespace core
