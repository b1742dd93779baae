#pragma once

#include "Types.hpp"
#include <functional>
#include <optional>

namespace core {

/**
 * Hysteresis state machine for the control mode
 *
 * States: Idle, Volume, Scroll (initial: Idle, no terminal state)
 *
 * - A gesture proposes a target mode (Unknown proposes nothing)
 * - A new candidate restarts the stability count
 * - The committed mode changes only after `commitThreshold` consecutive
 *   observations of the same candidate
 * - Unknown ticks neither advance nor reset the count
 */
class ModeController {
public:
    using TransitionCallback = std::function<void(ControlMode from, ControlMode to)>;

    explicit ModeController(int commitThreshold);

    /**
     * Feed one tick's gesture.
     * @return The transition if this tick committed a new mode
     */
    std::optional<ModeTransition> observe(GestureLabel label);

    [[nodiscard]] ControlMode getMode() const { return mode_; }
    [[nodiscard]] std::optional<ControlMode> getPendingMode() const { return pendingMode_; }
    [[nodiscard]] int getStabilityCounter() const { return stabilityCounter_; }
    [[nodiscard]] int getCommitThreshold() const { return commitThreshold_; }

    /**
     * Confidence (0-1) based on stability progress of the pending candidate.
     * 1.0 when nothing is pending against the committed mode.
     */
    [[nodiscard]] float getConfidence() const;

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    /**
     * Back to Idle with no pending candidate
     */
    void reset();

private:
    int commitThreshold_;

    ControlMode mode_ = ControlMode::Idle;
    std::optional<ControlMode> pendingMode_;
    int stabilityCounter_ = 0;

    TransitionCallback transitionCallback_;

    ModeTransition transitionTo(ControlMode newMode);
};

} // namespace core
