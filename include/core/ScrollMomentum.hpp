#pragma once

#include "Config.hpp"
#include "Types.hpp"
#include <chrono>
#include <optional>

namespace core {

/**
 * Scroll velocity with momentum.
 *
 * - Active gesture: finger distance -> speed (x adaptive multiplier),
 *   emitted as signed clicks and stored as momentum
 * - Cooldown between fresh emissions; the decay step runs instead
 * - No gesture: momentum is emitted and decays multiplicatively until
 *   it falls below the threshold, then snaps to zero
 *
 * All timing uses caller-supplied timestamps so dropped frames decay
 * by elapsed time, not by tick count.
 */
class ScrollMomentum {
public:
    using Clock = std::chrono::steady_clock;

    explicit ScrollMomentum(const ScrollConfig& config);

    /**
     * Advance one tick.
     * @param direction Active scroll gesture this tick, or std::nullopt
     * @param fingerDistance Index-middle tip distance (ignored without direction)
     * @param now Tick timestamp
     * @return Signed click count to emit this tick, if any
     */
    std::optional<int> update(std::optional<ScrollDirection> direction, float fingerDistance,
                              Clock::time_point now);

    /**
     * Finger distance -> base speed (before the adaptive multiplier)
     */
    [[nodiscard]] float speedForDistance(float fingerDistance) const;

    /**
     * Decay factor per reference tick for the last recorded speed.
     * Faster scrolling coasts longer.
     */
    [[nodiscard]] float currentDecayFactor() const;

    [[nodiscard]] float getMomentum() const { return momentum_; }
    [[nodiscard]] float getAdaptiveSpeed() const { return adaptiveSpeed_; }
    [[nodiscard]] float getLastSpeed() const { return lastSpeed_; }
    [[nodiscard]] bool isCoasting() const { return momentum_ != 0.0f; }

    void reset();

private:
    ScrollConfig config_;

    float momentum_ = 0.0f;
    float adaptiveSpeed_ = 1.0f;
    float lastSpeed_ = 0.0f;

    std::optional<Clock::time_point> lastActiveTime_;
    std::optional<Clock::time_point> lastEmissionTime_;
    std::optional<Clock::time_point> lastUpdateTime_;

    void updateAdaptiveSpeed(Clock::time_point now);
    std::optional<int> emitFresh(ScrollDirection direction, float fingerDistance, Clock::time_point now);
    std::optional<int> decay(Clock::time_point now);
};

} // namespace core
