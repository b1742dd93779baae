#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <lo/lo.h>
#include "core/ProcessingLoop.hpp"
#include "core/Types.hpp"

namespace net {

/**
 * Receives landmarks from an external hand detector over OSC and
 * publishes them into the processing slot (newest frame wins).
 *
 * Addresses:
 *   /hand/landmarks b   blob of 21 x {float32 x, y, z}, x/y normalized 0-1
 *   /hand/lost          no hand in view
 *
 * Blob floats are IEEE-754 little-endian, 12 bytes per point, whatever
 * the host byte order (see core/LandmarkBlob.hpp). Blobs whose size is
 * not a multiple of 12 are dropped and counted.
 *
 * Normalized x/y are scaled to the configured frame size so the
 * pixel-space thresholds apply unchanged.
 */
class OscLandmarkReceiver {
public:
    OscLandmarkReceiver(std::shared_ptr<core::LandmarkSlot> outputSlot, const std::string& port,
                        float frameWidth, float frameHeight);
    ~OscLandmarkReceiver();

    // Non-copyable (owns the liblo server thread)
    OscLandmarkReceiver(const OscLandmarkReceiver&) = delete;
    OscLandmarkReceiver& operator=(const OscLandmarkReceiver&) = delete;

    /**
     * Bind the port and start the liblo server thread.
     * @return false if the server cannot be created or started
     */
    bool start();
    void stop();

    [[nodiscard]] uint64_t getReceivedCount() const { return _received; }
    [[nodiscard]] uint64_t getRejectedCount() const { return _rejected; }

private:
    static int onLandmarks(const char* path, const char* types, lo_arg** argv, int argc,
                           lo_message msg, void* userData);
    static int onLost(const char* path, const char* types, lo_arg** argv, int argc,
                      lo_message msg, void* userData);
    static void onError(int num, const char* msg, const char* where);

    void handleLandmarks(const void* data, size_t size);

    std::shared_ptr<core::LandmarkSlot> _outputSlot;
    std::string _port;
    float _frameWidth;
    float _frameHeight;

    lo_server_thread _server = nullptr;
    std::atomic<bool> _running;
    std::atomic<uint64_t> _received{0};
    std::atomic<uint64_t> _rejected{0};
};

} // namespace net
