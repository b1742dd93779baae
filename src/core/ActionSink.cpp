#include "core/ActionSink.hpp"
#include "core/GestureController.hpp"
#include "core/Logger.hpp"

namespace core {

int dispatchActions(const TickResult& result, ActionSink& sink) {
    int failures = 0;

    if (result.volumeLevel) {
        if (!sink.setVolume(*result.volumeLevel)) {
            Logger::error("ActionSink: setVolume(", *result.volumeLevel, ") rejected");
            failures++;
        }
    }

    if (result.scrollClicks) {
        if (!sink.scroll(*result.scrollClicks)) {
            Logger::error("ActionSink: scroll(", *result.scrollClicks, ") rejected");
            failures++;
        }
    }

    return failures;
}

} // namespace core
