#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

#include "Types.hpp"
#include "Logger.hpp"
#include "ActionSink.hpp"
#include "GestureController.hpp"
#include "LatestValue.hpp"

namespace core {

using LandmarkSlot = LatestValue<LandmarkFrame>;

/**
 * Tick driver
 *
 * Runs the GestureController at a fixed rate on its own thread:
 * - takes the newest landmark frame from the slot (older ones are gone)
 * - a frame feeds exactly one tick; ticks without a new frame run as "no hand"
 *   so momentum keeps decaying but hysteresis gets no extra evidence
 * - frames already older than staleFrameTimeout when taken count as "no hand"
 * - hands volume/scroll commands to the ActionSink
 * - publishes feedback at a lower rate
 */
class ProcessingLoop {
public:
    struct Config {
        float tickRateHz = 60.0f;
        std::chrono::milliseconds staleFrameTimeout{100};
        float feedbackRateHz = 30.0f;
    };

    using PreviewCallback = std::function<void(const LandmarkFrame* frame, const TickResult& result)>;

    ProcessingLoop(std::shared_ptr<LandmarkSlot> inputSlot,
                   std::shared_ptr<ActionSink> actionSink,
                   const ControllerConfig& controllerConfig,
                   const Config& config);
    ~ProcessingLoop();

    // Non-copyable
    ProcessingLoop(const ProcessingLoop&) = delete;
    ProcessingLoop& operator=(const ProcessingLoop&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Run one tick synchronously (also used for replay).
     * @param frame Landmarks for this tick, nullptr if no hand
     */
    TickResult processFrame(const LandmarkFrame* frame, std::chrono::steady_clock::time_point now);

    /**
     * Called after every tick on the processing thread
     */
    void setPreviewCallback(PreviewCallback callback) { _previewCallback = std::move(callback); }

    [[nodiscard]] const GestureController& controller() const { return _controller; }
    [[nodiscard]] uint64_t getTickCount() const { return _tickCount; }
    [[nodiscard]] uint64_t getActionFailures() const { return _actionFailures; }

    /**
     * Ticks per second over the last full one-second window of tick timestamps,
     * 0 until the first window closes. Replay ticks use the recorded timestamps.
     */
    [[nodiscard]] float getMeasuredTickRate() const { return _measuredTickRate; }

private:
    void loop();
    const LandmarkFrame* selectFrame(std::chrono::steady_clock::time_point now);
    void updateTickRate(std::chrono::steady_clock::time_point now);

    std::shared_ptr<LandmarkSlot> _inputSlot;
    std::shared_ptr<ActionSink> _actionSink;
    Config _config;

    GestureController _controller;
    std::optional<LandmarkFrame> _currentFrame;

    std::atomic<bool> _running;
    std::thread _thread;

    PreviewCallback _previewCallback;

    std::atomic<uint64_t> _tickCount{0};
    std::atomic<uint64_t> _actionFailures{0};
    std::chrono::steady_clock::time_point _lastFeedbackTime;
    ControlMode _lastPublishedMode = ControlMode::Idle;

    // FPS Counting
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    bool _rateWindowStarted = false;
    uint64_t _rateWindows = 0;
    std::atomic<float> _measuredTickRate{0.0f};
};

} // namespace core
