#include "core/Types.hpp"
#include <cmath>

namespace core {

bool LandmarkFrame::isFinite() const {
    for (const auto& lm : landmarks) {
        if (!std::isfinite(lm.x) || !std::isfinite(lm.y) || !std::isfinite(lm.z)) {
            return false;
        }
    }
    return true;
}

const char* toString(GestureLabel label) {
    switch (label) {
        case GestureLabel::Fist:       return "FIST";
        case GestureLabel::ScrollUp:   return "SCROLL_UP";
        case GestureLabel::ScrollDown: return "SCROLL_DOWN";
        case GestureLabel::Volume:     return "VOLUME";
        case GestureLabel::Unknown:    return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

const char* toString(ControlMode mode) {
    switch (mode) {
        case ControlMode::Idle:   return "IDLE";
        case ControlMode::Volume: return "VOLUME";
        case ControlMode::Scroll: return "SCROLL";
        default: return "IDLE";
    }
}

const char* toString(HandOrientation orientation) {
    return orientation == HandOrientation::Right ? "R" : "L";
}

std::optional<ControlMode> targetModeFor(GestureLabel label) {
    switch (label) {
        case GestureLabel::Fist:       return ControlMode::Idle;
        case GestureLabel::ScrollUp:
        case GestureLabel::ScrollDown: return ControlMode::Scroll;
        case GestureLabel::Volume:     return ControlMode::Volume;
        case GestureLabel::Unknown:    return std::nullopt;
    }
    return std::nullopt;
}

} // namespace core
