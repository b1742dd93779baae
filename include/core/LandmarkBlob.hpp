#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "Types.hpp"

namespace core {

/**
 * Wire format of a landmark blob:
 * consecutive points of three IEEE-754 float32 values (x, y, z),
 * each stored little-endian, 12 bytes per point, no header or padding.
 */
constexpr size_t LANDMARK_BLOB_STRIDE = 12;

/**
 * Decode a landmark blob independent of host byte order.
 * x and y are multiplied by scaleX / scaleY, z is kept as sent.
 * @return nullopt if size is not a whole number of points
 */
std::optional<std::vector<Landmark>> decodeLandmarkBlob(const unsigned char* data, size_t size,
                                                        float scaleX, float scaleY);

} // namespace core
