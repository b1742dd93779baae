#include "core/ScrollMomentum.hpp"
#include "core/Logger.hpp"
#include "math/Filters.hpp"
#include <algorithm>
#include <cmath>

namespace core {

namespace {

double seconds(std::chrono::steady_clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

ScrollMomentum::ScrollMomentum(const ScrollConfig& config) : config_(config) {
    reset();
}

void ScrollMomentum::reset() {
    momentum_ = 0.0f;
    adaptiveSpeed_ = 1.0f;
    lastSpeed_ = 0.0f;
    lastActiveTime_.reset();
    lastEmissionTime_.reset();
    lastUpdateTime_.reset();
}

float ScrollMomentum::speedForDistance(float fingerDistance) const {
    return math::interpolate(fingerDistance, config_.distanceMin, config_.distanceMax,
                             config_.speedMin, config_.speedMax);
}

float ScrollMomentum::currentDecayFactor() const {
    float t = math::normalize(lastSpeed_, config_.speedMin, config_.speedMax);
    return config_.decayFast + t * (config_.decaySlow - config_.decayFast);
}

std::optional<int> ScrollMomentum::update(std::optional<ScrollDirection> direction, float fingerDistance,
                                          Clock::time_point now) {
    std::optional<int> clicks;

    if (direction) {
        updateAdaptiveSpeed(now);

        bool inCooldown = lastEmissionTime_ && (now - *lastEmissionTime_) < config_.cooldown;
        clicks = inCooldown ? decay(now) : emitFresh(*direction, fingerDistance, now);
    } else {
        clicks = decay(now);
    }

    lastUpdateTime_ = now;
    return clicks;
}

void ScrollMomentum::updateAdaptiveSpeed(Clock::time_point now) {
    // Sustained scrolling ramps up, a pause resets
    if (lastActiveTime_ && (now - *lastActiveTime_) < config_.adaptiveGap) {
        adaptiveSpeed_ = std::min(adaptiveSpeed_ * config_.adaptiveGrowth, config_.adaptiveMax);
    } else {
        adaptiveSpeed_ = 1.0f;
    }
    lastActiveTime_ = now;
}

std::optional<int> ScrollMomentum::emitFresh(ScrollDirection direction, float fingerDistance,
                                             Clock::time_point now) {
    lastSpeed_ = speedForDistance(fingerDistance);
    float speed = lastSpeed_ * adaptiveSpeed_;
    float sign = direction == ScrollDirection::Up ? 1.0f : -1.0f;

    momentum_ = sign * speed;
    lastEmissionTime_ = now;

    int clicks = static_cast<int>(momentum_);
    Logger::debug("ScrollMomentum: fresh ", clicks, " clicks (speed=", lastSpeed_,
                  " adaptive=", adaptiveSpeed_, ")");
    if (clicks == 0) return std::nullopt;
    return clicks;
}

std::optional<int> ScrollMomentum::decay(Clock::time_point now) {
    if (std::abs(momentum_) <= config_.momentumThreshold) {
        momentum_ = 0.0f;
        return std::nullopt;
    }

    // Emit at the current magnitude, then decay for the next tick
    int clicks = static_cast<int>(momentum_);

    double dt = lastUpdateTime_ ? seconds(now - *lastUpdateTime_) : seconds(config_.referenceTick);
    momentum_ *= math::decayOverTime(currentDecayFactor(), dt, seconds(config_.referenceTick));

    if (std::abs(momentum_) <= config_.momentumThreshold) {
        momentum_ = 0.0f;
    }

    if (clicks == 0) return std::nullopt;
    return clicks;
}

} // namespace core
