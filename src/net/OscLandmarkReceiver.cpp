#include "net/OscLandmarkReceiver.hpp"
#include "core/LandmarkBlob.hpp"
#include "core/Logger.hpp"
#include <chrono>

namespace net {

OscLandmarkReceiver::OscLandmarkReceiver(std::shared_ptr<core::LandmarkSlot> outputSlot, const std::string& port,
                                         float frameWidth, float frameHeight)
    : _outputSlot(std::move(outputSlot)), _port(port),
      _frameWidth(frameWidth), _frameHeight(frameHeight), _running(false) {
}

OscLandmarkReceiver::~OscLandmarkReceiver() {
    stop();
    if (_server) {
        lo_server_thread_free(_server);
    }
}

bool OscLandmarkReceiver::start() {
    if (_running) return true;

    if (!_server) {
        _server = lo_server_thread_new(_port.c_str(), &OscLandmarkReceiver::onError);
        if (!_server) {
            core::Logger::error("OscLandmarkReceiver: Failed to bind UDP port ", _port);
            return false;
        }
        lo_server_thread_add_method(_server, "/hand/landmarks", "b", &OscLandmarkReceiver::onLandmarks, this);
        lo_server_thread_add_method(_server, "/hand/lost", "", &OscLandmarkReceiver::onLost, this);
    }

    if (lo_server_thread_start(_server) < 0) {
        core::Logger::error("OscLandmarkReceiver: Failed to start server thread on port ", _port);
        return false;
    }

    _running = true;
    core::Logger::info("OscLandmarkReceiver listening on UDP ", _port);
    return true;
}

void OscLandmarkReceiver::stop() {
    if (!_running) return;
    _running = false;
    lo_server_thread_stop(_server);
    core::Logger::info("OscLandmarkReceiver stopped (", _received.load(), " frames received, ", _rejected.load(), " blobs rejected).");
}

int OscLandmarkReceiver::onLandmarks(const char* /*path*/, const char* /*types*/, lo_arg** argv, int argc,
                                     lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscLandmarkReceiver*>(userData);
    if (argc < 1) return 0;

    lo_blob blob = static_cast<lo_blob>(argv[0]);
    self->handleLandmarks(lo_blob_dataptr(blob), lo_blob_datasize(blob));
    return 0;
}

int OscLandmarkReceiver::onLost(const char* /*path*/, const char* /*types*/, lo_arg** /*argv*/, int /*argc*/,
                                lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscLandmarkReceiver*>(userData);

    // Empty frame = explicit "no hand"
    core::LandmarkFrame frame;
    frame.timestamp = std::chrono::steady_clock::now();
    self->_outputSlot->publish(std::move(frame));
    return 0;
}

void OscLandmarkReceiver::onError(int num, const char* msg, const char* where) {
    core::Logger::error("OscLandmarkReceiver: liblo error ", num, " in ", (where ? where : "?"),
                        ": ", (msg ? msg : ""));
}

void OscLandmarkReceiver::handleLandmarks(const void* data, size_t size) {
    auto landmarks = core::decodeLandmarkBlob(static_cast<const unsigned char*>(data), size,
                                              _frameWidth, _frameHeight);
    if (!landmarks) {
        _rejected++;
        core::Logger::warn("OscLandmarkReceiver: dropped blob of ", size, " bytes (not a multiple of ",
                           core::LANDMARK_BLOB_STRIDE, ")");
        return;
    }
    if (landmarks->size() != core::LANDMARK_COUNT) {
        core::Logger::debug("OscLandmarkReceiver: blob of ", size, " bytes holds ", landmarks->size(), " landmarks");
    }

    core::LandmarkFrame frame;
    frame.landmarks = std::move(*landmarks);
    frame.timestamp = std::chrono::steady_clock::now();

    _received++;
    _outputSlot->publish(std::move(frame));
}

} // namespace net
