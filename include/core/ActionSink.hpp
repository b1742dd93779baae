#pragma once

#include "Types.hpp"
#include <string>

namespace core {

struct TickResult;

/**
 * What the renderer / remote UI shows. Pure snapshot of controller state.
 */
struct FeedbackState {
    ControlMode mode = ControlMode::Idle;
    GestureLabel gesture = GestureLabel::Unknown;
    float value = 0.0f;        // Volume percent in Volume mode, scroll speed in Scroll mode
    float confidence = 1.0f;   // Progress of a pending mode change
    float stability = 0.0f;    // Share of recent ticks with the current gesture
};

/**
 * System-action executor.
 * Each call reports whether the platform accepted the command;
 * a rejection never feeds back into controller state.
 */
class ActionSink {
public:
    virtual ~ActionSink() = default;

    virtual bool setVolume(float level) = 0;
    virtual bool scroll(int clicks) = 0;

    /**
     * Optional feedback channel. Default: nothing to publish.
     */
    virtual bool publishFeedback(const FeedbackState& /*state*/) { return true; }
};

/**
 * Hand a tick's actions to the executor and log failures.
 * @return Number of commands the executor rejected
 */
int dispatchActions(const TickResult& result, ActionSink& sink);

} // namespace core
