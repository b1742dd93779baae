#pragma once

#include <opencv2/core.hpp>
#include "core/GestureController.hpp"
#include "core/Types.hpp"

namespace render {

/**
 * Diagnostic overlay for the gesture controller.
 * Reads a tick result, never feeds anything back.
 *
 * - Status box: mode, gesture, confidence, stability, tick rate
 * - Volume bar with percentage (Volume mode)
 * - Scroll speed bar (Scroll mode)
 * - Hand skeleton and pinch line
 */
class DebugOverlay {
public:
    explicit DebugOverlay(const core::ControllerConfig& config) : _config(config) {}

    /**
     * Draw onto `canvas` (BGR, any size; landmark pixels are drawn as-is)
     */
    void draw(cv::Mat& canvas, const core::LandmarkFrame* frame, const core::TickResult& result,
              float tickRate) const;

    /**
     * Blank canvas matching the landmark frame space
     */
    static cv::Mat makeCanvas(int width, int height);

private:
    void drawStatus(cv::Mat& canvas, const core::TickResult& result, float tickRate) const;
    void drawSkeleton(cv::Mat& canvas, const core::LandmarkFrame& frame, const core::TickResult& result) const;
    void drawVolumeBar(cv::Mat& canvas, const core::TickResult& result) const;
    void drawScrollBar(cv::Mat& canvas, const core::TickResult& result) const;

    core::ControllerConfig _config;
};

} // namespace render
