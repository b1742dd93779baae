#include "net/OscActionSink.hpp"

namespace net {

OscActionSink::OscActionSink(const std::string& host, const std::string& port)
    : _host(host), _port(port) {
}

OscActionSink::~OscActionSink() {
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscActionSink::start() {
    if (_loAddress) return true;

    // Initialize liblo address
    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        core::Logger::error("OscActionSink: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    core::Logger::info("OscActionSink ready. Target: ", _host, ":", _port);
    return true;
}

bool OscActionSink::setVolume(float level) {
    lo_message msg = lo_message_new();
    lo_message_add_float(msg, level);
    return send("/action/volume", msg);
}

bool OscActionSink::scroll(int clicks) {
    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(clicks));
    return send("/action/scroll", msg);
}

bool OscActionSink::publishFeedback(const core::FeedbackState& state) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, core::toString(state.mode));
    lo_message_add_string(msg, core::toString(state.gesture));
    lo_message_add_float(msg, state.value);
    lo_message_add_float(msg, state.confidence);
    return send("/feedback/state", msg);
}

bool OscActionSink::send(const char* path, lo_message msg) {
    if (!_loAddress) {
        lo_message_free(msg);
        return false;
    }

    int ret = lo_send_message(_loAddress, path, msg);
    lo_message_free(msg);

    if (ret == -1) {
        core::Logger::debug("OscActionSink: ", path, " failed: ", lo_address_errstr(_loAddress));
        return false;
    }
    return true;
}

} // namespace net
