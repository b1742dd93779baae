#pragma once

#include <algorithm>
#include <cmath>

namespace math {

/**
 * Piecewise-linear map of `value` from [inMin, inMax] to [outMin, outMax].
 * Values outside the input range clamp to the nearest output bound.
 * Requires inMin < inMax. outMin may be greater than outMax (inverted map).
 */
inline float interpolate(float value, float inMin, float inMax, float outMin, float outMax) {
    if (value <= inMin) return outMin;
    if (value >= inMax) return outMax;
    float t = (value - inMin) / (inMax - inMin);
    return outMin + t * (outMax - outMin);
}

/**
 * Position of `value` inside [min, max] as 0..1
 */
inline float normalize(float value, float min, float max) {
    return std::clamp((value - min) / (max - min), 0.0f, 1.0f);
}

/**
 * Arithmetic mean of a range of floats. Returns `fallback` for an empty range.
 */
template<typename Range>
float mean(const Range& values, float fallback = 0.0f) {
    float sum = 0.0f;
    size_t n = 0;
    for (float v : values) {
        sum += v;
        ++n;
    }
    return n == 0 ? fallback : sum / static_cast<float>(n);
}

/**
 * Spike suppression: weighted blend of the newest sample with the mean of
 * recent samples. weight = 1 passes the sample through unchanged.
 */
class MeanBlendFilter {
public:
    explicit MeanBlendFilter(float instantWeight = 0.7f)
        : _instantWeight(std::clamp(instantWeight, 0.0f, 1.0f)) {}

    template<typename Range>
    float filter(float instant, const Range& history) {
        float historical = mean(history, instant);
        _value = _instantWeight * instant + (1.0f - _instantWeight) * historical;
        _initialized = true;
        return _value;
    }

    void reset() {
        _value = 0.0f;
        _initialized = false;
    }

    float value() const { return _value; }
    bool initialized() const { return _initialized; }

private:
    float _instantWeight;
    float _value = 0.0f;
    bool _initialized = false;
};

/**
 * Per-tick multiplicative decay scaled to elapsed time:
 * factor^(dt / referenceDt). Frame drops decay proportionally more.
 */
inline float decayOverTime(float factor, double dtSeconds, double referenceDtSeconds) {
    if (dtSeconds <= 0.0 || referenceDtSeconds <= 0.0) return 1.0f;
    return static_cast<float>(std::pow(static_cast<double>(factor), dtSeconds / referenceDtSeconds));
}

/**
 * Pixel coordinate for drawing: NaN maps to 0, everything else is clamped
 * to [-margin, limit + margin] before the integer conversion.
 */
inline int toPixel(float value, int limit, int margin = 1000) {
    if (std::isnan(value)) return 0;
    float lo = static_cast<float>(-margin);
    float hi = static_cast<float>(limit + margin);
    return static_cast<int>(std::clamp(value, lo, hi));
}

} // namespace math
