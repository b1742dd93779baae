#include "core/VolumeMapper.hpp"

namespace core {

VolumeMapper::VolumeMapper(const VolumeConfig& config)
    : _config(config),
      _smoother(config.instantWeight),
      _lastLevel(config.levelMin) {
}

float VolumeMapper::update(float thumbIndexDistance, const BoundedHistory<float>& distanceHistory) {
    float blended = _smoother.filter(thumbIndexDistance, distanceHistory);
    _lastLevel = mapDistance(blended);
    return _lastLevel;
}

float VolumeMapper::mapDistance(float blendedDistance) const {
    return math::interpolate(blendedDistance,
                             _config.handRangeMin, _config.handRangeMax,
                             _config.levelMin, _config.levelMax);
}

float VolumeMapper::toPercent(float level) const {
    return math::interpolate(level, _config.levelMin, _config.levelMax, 0.0f, 100.0f);
}

void VolumeMapper::reset() {
    _smoother.reset();
    _lastLevel = _config.levelMin;
}

} // namespace core
