#pragma once

#include "Config.hpp"
#include "History.hpp"
#include "math/Filters.hpp"

namespace core {

/**
 * Pinch distance -> volume level.
 *
 * Blends the instantaneous distance with the mean of recent distances
 * (instantWeight / 1 - instantWeight), then maps the blended distance
 * linearly from the hand range to the level range, clamped at both ends.
 */
class VolumeMapper {
public:
    explicit VolumeMapper(const VolumeConfig& config);

    /**
     * @param thumbIndexDistance Pinch distance of this tick
     * @param distanceHistory Recent pinch distances (may include this tick)
     * @return Level in [levelMin, levelMax]
     */
    float update(float thumbIndexDistance, const BoundedHistory<float>& distanceHistory);

    /**
     * Map an already smoothed distance (no state change)
     */
    [[nodiscard]] float mapDistance(float blendedDistance) const;

    /**
     * Level as 0-100 for display
     */
    [[nodiscard]] float toPercent(float level) const;

    [[nodiscard]] bool hasSmoothedDistance() const { return _smoother.initialized(); }
    [[nodiscard]] float getSmoothedDistance() const { return _smoother.value(); }
    [[nodiscard]] float getLastLevel() const { return _lastLevel; }

    void reset();

private:
    VolumeConfig _config;
    math::MeanBlendFilter _smoother;
    float _lastLevel;
};

} // namespace core
