#pragma once

#include <string>
#include <lo/lo.h>
#include "core/ActionSink.hpp"
#include "core/Logger.hpp"

namespace net {

/**
 * ActionSink that forwards commands to an executor process over OSC.
 *
 * Addresses:
 *   /action/volume  f      level in the executor's range
 *   /action/scroll  i      signed clicks (positive = up)
 *   /feedback/state s s f f mode, gesture, value, confidence
 */
class OscActionSink : public core::ActionSink {
public:
    OscActionSink(const std::string& host, const std::string& port);
    ~OscActionSink() override;

    // Non-copyable (owns the liblo address)
    OscActionSink(const OscActionSink&) = delete;
    OscActionSink& operator=(const OscActionSink&) = delete;

    /**
     * Resolve the target address.
     * @return false if liblo cannot create the address
     */
    bool start();

    bool setVolume(float level) override;
    bool scroll(int clicks) override;
    bool publishFeedback(const core::FeedbackState& state) override;

private:
    bool send(const char* path, lo_message msg);

    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;
};

} // namespace net
