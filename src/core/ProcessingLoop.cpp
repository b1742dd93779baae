#include "core/ProcessingLoop.hpp"
#include <algorithm>

namespace core {

ProcessingLoop::ProcessingLoop(std::shared_ptr<LandmarkSlot> inputSlot,
                               std::shared_ptr<ActionSink> actionSink,
                               const ControllerConfig& controllerConfig,
                               const Config& config)
    : _inputSlot(std::move(inputSlot)),
      _actionSink(std::move(actionSink)),
      _config(config),
      _controller(controllerConfig),
      _running(false) {
}

ProcessingLoop::~ProcessingLoop() {
    stop();
}

void ProcessingLoop::start() {
    if (_running) return;
    _running = true;
    _thread = std::thread(&ProcessingLoop::loop, this);
    Logger::info("ProcessingLoop started at ", _config.tickRateHz, " Hz.");
}

void ProcessingLoop::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("ProcessingLoop stopped after ", _tickCount.load(), " ticks (",
                 _actionFailures.load(), " rejected actions).");
}

bool ProcessingLoop::isRunning() const {
    return _running;
}

void ProcessingLoop::loop() {
    using Clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / std::max(_config.tickRateHz, 1.0f)));

    auto nextTick = Clock::now();
    while (_running) {
        auto now = Clock::now();
        const LandmarkFrame* frame = selectFrame(now);
        processFrame(frame, now);

        nextTick += period;
        if (nextTick < Clock::now()) {
            // Overran: resync instead of bursting to catch up
            nextTick = Clock::now();
        }
        std::this_thread::sleep_until(nextTick);
    }
}

const LandmarkFrame* ProcessingLoop::selectFrame(std::chrono::steady_clock::time_point now) {
    // A frame is one observation: it is handed out on the tick it arrives only
    _currentFrame.reset();
    auto fresh = _inputSlot->take();
    if (!fresh) return nullptr;

    // Hand lost, or the frame sat in the slot too long
    if (fresh->landmarks.empty() || now - fresh->timestamp > _config.staleFrameTimeout) {
        return nullptr;
    }
    _currentFrame = std::move(*fresh);
    return &*_currentFrame;
}

void ProcessingLoop::updateTickRate(std::chrono::steady_clock::time_point now) {
    if (!_rateWindowStarted) {
        _rateWindowStarted = true;
        _lastFpsTime = now;
        _frameCount = 0;
        return;
    }

    // FPS Calculation
    _frameCount++;
    auto elapsed = std::chrono::duration<double>(now - _lastFpsTime).count();
    if (elapsed >= 1.0) {
        _measuredTickRate = static_cast<float>(_frameCount / elapsed);
        if (++_rateWindows % 5 == 0) {
            Logger::debug("ProcessingLoop: ", _measuredTickRate.load(), " ticks/s, ",
                          _inputSlot->droppedCount(), " frames superseded so far");
        }
        _frameCount = 0;
        _lastFpsTime = now;
    }
}

TickResult ProcessingLoop::processFrame(const LandmarkFrame* frame, std::chrono::steady_clock::time_point now) {
    TickResult result = _controller.tick(frame, now);
    _tickCount++;
    updateTickRate(now);

    if (_actionSink) {
        int failures = dispatchActions(result, *_actionSink);
        if (failures > 0) {
            _actionFailures += static_cast<uint64_t>(failures);
        }

        bool modeChanged = result.mode != _lastPublishedMode;
        auto sinceFeedback = std::chrono::duration<double>(now - _lastFeedbackTime).count();
        if (modeChanged || sinceFeedback >= 1.0 / std::max(_config.feedbackRateHz, 1.0f)) {
            if (!_actionSink->publishFeedback(result.feedback)) {
                Logger::debug("ProcessingLoop: feedback publish failed");
            }
            _lastFeedbackTime = now;
            _lastPublishedMode = result.mode;
        }
    }

    if (_previewCallback) {
        _previewCallback(frame, result);
    }

    return result;
}

} // namespace core
