#include "core/LandmarkBlob.hpp"
#include <cstdint>
#include <cstring>
#include <limits>

namespace core {

static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4,
              "landmark blobs carry IEEE-754 float32");

namespace {

float readFloatLE(const unsigned char* p) {
    uint32_t bits = static_cast<uint32_t>(p[0]) |
                    (static_cast<uint32_t>(p[1]) << 8) |
                    (static_cast<uint32_t>(p[2]) << 16) |
                    (static_cast<uint32_t>(p[3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace

std::optional<std::vector<Landmark>> decodeLandmarkBlob(const unsigned char* data, size_t size,
                                                        float scaleX, float scaleY) {
    if (size % LANDMARK_BLOB_STRIDE != 0 || (size > 0 && data == nullptr)) {
        return std::nullopt;
    }

    std::vector<Landmark> landmarks;
    landmarks.reserve(size / LANDMARK_BLOB_STRIDE);
    for (size_t offset = 0; offset < size; offset += LANDMARK_BLOB_STRIDE) {
        const unsigned char* p = data + offset;
        landmarks.push_back({readFloatLE(p) * scaleX, readFloatLE(p + 4) * scaleY, readFloatLE(p + 8)});
    }
    return landmarks;
}

} // namespace core
