#include "core/Config.hpp"
#include <sstream>

namespace core {

namespace {

void checkRange(std::vector<std::string>& problems, const char* name, float lo, float hi) {
    if (!(lo < hi)) {
        std::ostringstream ss;
        ss << name << ": lower bound " << lo << " must be below upper bound " << hi;
        problems.push_back(ss.str());
    }
}

void checkUnitInterval(std::vector<std::string>& problems, const char* name, float value,
                       bool allowZero, bool allowOne) {
    bool ok = (allowZero ? value >= 0.0f : value > 0.0f) &&
              (allowOne ? value <= 1.0f : value < 1.0f);
    if (!ok) {
        std::ostringstream ss;
        ss << name << ": " << value << " outside " << (allowZero ? "[" : "(") << "0, 1"
           << (allowOne ? "]" : ")");
        problems.push_back(ss.str());
    }
}

} // namespace

std::vector<std::string> ControllerConfig::validate() const {
    std::vector<std::string> problems;

    if (gesture.commitThreshold < 1) {
        problems.push_back("gesture.commitThreshold must be at least 1");
    }
    if (gesture.minVolumePinch < 0.0f) {
        problems.push_back("gesture.minVolumePinch must not be negative");
    }

    checkRange(problems, "volume.handRange", volume.handRangeMin, volume.handRangeMax);
    checkRange(problems, "volume.level", volume.levelMin, volume.levelMax);
    checkUnitInterval(problems, "volume.instantWeight", volume.instantWeight, true, true);

    checkRange(problems, "scroll.distance", scroll.distanceMin, scroll.distanceMax);
    checkRange(problems, "scroll.speed", scroll.speedMin, scroll.speedMax);
    if (scroll.speedMin < 1.0f) {
        problems.push_back("scroll.speedMin must be at least one click");
    }
    if (scroll.cooldown.count() < 0 || scroll.adaptiveGap.count() < 0) {
        problems.push_back("scroll timing intervals must not be negative");
    }
    if (scroll.adaptiveGrowth < 1.0f || scroll.adaptiveMax < 1.0f) {
        problems.push_back("scroll.adaptiveGrowth and scroll.adaptiveMax must be >= 1");
    }
    if (scroll.momentumThreshold <= 0.0f) {
        problems.push_back("scroll.momentumThreshold must be positive");
    }
    checkUnitInterval(problems, "scroll.decaySlow", scroll.decaySlow, false, false);
    checkUnitInterval(problems, "scroll.decayFast", scroll.decayFast, false, false);
    if (scroll.decayFast > scroll.decaySlow) {
        problems.push_back("scroll.decayFast must not exceed scroll.decaySlow");
    }
    if (scroll.referenceTick.count() <= 0) {
        problems.push_back("scroll.referenceTick must be positive");
    }

    if (history.gestureHistorySize == 0 || history.distanceHistorySize == 0) {
        problems.push_back("history sizes must be at least 1");
    }

    return problems;
}

ControllerConfig getDefaultConfig() {
    return ControllerConfig{};
}

ControllerConfig getResponsiveConfig() {
    ControllerConfig config;
    config.gesture.commitThreshold = 3;           // ~50ms @ 60fps
    config.scroll.cooldown = std::chrono::milliseconds(33);
    config.scroll.adaptiveGrowth = 1.02f;
    config.scroll.decaySlow = 0.95f;              // Shorter coasting
    config.scroll.decayFast = 0.85f;
    config.history.distanceHistorySize = 6;
    return config;
}

ControllerConfig getDecibelVolumeConfig() {
    ControllerConfig config;
    config.volume.levelMin = -63.5f;
    config.volume.levelMax = 0.0f;
    return config;
}

} // namespace core
