#include "render/DebugOverlay.hpp"
#include "math/Filters.hpp"
#include <cstdio>
#include <utility>
#include <vector>
#include <opencv2/imgproc.hpp>

namespace render {

namespace {

// Helper: Draw semi-transparent rectangle
void drawTransparentRect(cv::Mat& canvas, cv::Rect rect, cv::Scalar color, double alpha) {
    cv::Mat overlay = canvas.clone();
    cv::rectangle(overlay, rect, color, cv::FILLED);
    cv::addWeighted(overlay, alpha, canvas, 1.0 - alpha, 0, canvas);
}

cv::Scalar modeColor(core::ControlMode mode) {
    switch (mode) {
        case core::ControlMode::Volume: return cv::Scalar(0, 215, 255);  // Amber
        case core::ControlMode::Scroll: return cv::Scalar(0, 255, 0);    // Green
        case core::ControlMode::Idle:   return cv::Scalar(180, 180, 180);
    }
    return cv::Scalar(180, 180, 180);
}

} // namespace

cv::Mat DebugOverlay::makeCanvas(int width, int height) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(32, 32, 32));
}

void DebugOverlay::draw(cv::Mat& canvas, const core::LandmarkFrame* frame, const core::TickResult& result,
                        float tickRate) const {
    if (canvas.empty()) {
        return;
    }

    // A bad detector frame draws no skeleton
    if (frame && frame->isComplete() && frame->isFinite()) {
        drawSkeleton(canvas, *frame, result);
    }

    switch (result.mode) {
        case core::ControlMode::Volume: drawVolumeBar(canvas, result); break;
        case core::ControlMode::Scroll: drawScrollBar(canvas, result); break;
        case core::ControlMode::Idle: break;
    }

    drawStatus(canvas, result, tickRate);
}

void DebugOverlay::drawStatus(cv::Mat& canvas, const core::TickResult& result, float tickRate) const {
    // === TOP LEFT: Status Info Box ===
    drawTransparentRect(canvas, cv::Rect(5, 5, 260, 110), cv::Scalar(0, 0, 0), 0.6);

    int yPos = 24;
    const int lineHeight = 22;
    char buf[64];

    cv::putText(canvas, std::string("Mode: ") + core::toString(result.mode), cv::Point(10, yPos),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, modeColor(result.mode), 2);
    yPos += lineHeight;

    cv::Scalar gestureColor = (result.gesture != core::GestureLabel::Unknown) ? cv::Scalar(0, 255, 0)
                                                                              : cv::Scalar(150, 150, 150);
    cv::putText(canvas, std::string("Gesture: ") + core::toString(result.gesture), cv::Point(10, yPos),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, gestureColor, 1);
    yPos += lineHeight;

    std::snprintf(buf, sizeof(buf), "Confidence: %.0f%%  Stable: %.0f%%",
                  result.feedback.confidence * 100.0f, result.feedback.stability * 100.0f);
    cv::putText(canvas, buf, cv::Point(10, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(255, 255, 255), 1);
    yPos += lineHeight;

    // Tick rate with color coding
    cv::Scalar rateColor = (tickRate >= 55) ? cv::Scalar(0, 255, 0) :
                           (tickRate >= 30) ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 0, 255);
    std::snprintf(buf, sizeof(buf), "Ticks/s: %.1f", tickRate);
    cv::putText(canvas, buf, cv::Point(10, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.45, rateColor, 1);
}

void DebugOverlay::drawSkeleton(cv::Mat& canvas, const core::LandmarkFrame& frame,
                                const core::TickResult& result) const {
    cv::Scalar skeletonColor = cv::Scalar(0, 255, 0);
    cv::Scalar jointColor = cv::Scalar(0, 0, 255);

    std::vector<cv::Point> points;
    points.reserve(frame.landmarks.size());
    for (const auto& lm : frame.landmarks) {
        points.emplace_back(math::toPixel(lm.x, canvas.cols), math::toPixel(lm.y, canvas.rows));
    }

    // Draw Skeleton connections
    const std::vector<std::pair<int, int>> connections = {
        {0, 1}, {1, 2}, {2, 3}, {3, 4},          // Thumb
        {0, 5}, {5, 6}, {6, 7}, {7, 8},          // Index
        {5, 9}, {9, 10}, {10, 11}, {11, 12},     // Middle
        {9, 13}, {13, 14}, {14, 15}, {15, 16},   // Ring
        {13, 17}, {0, 17}, {17, 18}, {18, 19}, {19, 20}  // Pinky + palm
    };
    for (const auto& conn : connections) {
        cv::line(canvas, points[conn.first], points[conn.second], skeletonColor, 2);
    }

    // Extended fingertips are highlighted
    const int tips[] = {core::LandmarkIndices::THUMB_TIP, core::LandmarkIndices::INDEX_TIP,
                        core::LandmarkIndices::MIDDLE_TIP, core::LandmarkIndices::RING_TIP,
                        core::LandmarkIndices::PINKY_TIP};
    for (size_t j = 0; j < points.size(); ++j) {
        int radius = 3;
        for (int f = 0; f < static_cast<int>(core::FINGER_COUNT); ++f) {
            if (static_cast<int>(j) == tips[f] && result.reading && result.reading->fingers[f]) {
                radius = 7;
            }
        }
        cv::circle(canvas, points[j], radius, jointColor, -1);
        cv::circle(canvas, points[j], radius, cv::Scalar(255, 255, 255), 1); // White outline
    }

    // Pinch line in Volume mode
    if (result.mode == core::ControlMode::Volume) {
        const cv::Point& thumb = points[core::LandmarkIndices::THUMB_TIP];
        const cv::Point& index = points[core::LandmarkIndices::INDEX_TIP];
        cv::Scalar pinchColor(0, 215, 255);
        cv::line(canvas, thumb, index, pinchColor, 3);
        cv::circle(canvas, (thumb + index) / 2, 8, pinchColor, cv::FILLED);
    }
}

void DebugOverlay::drawVolumeBar(cv::Mat& canvas, const core::TickResult& result) const {
    const int top = 150;
    const int bottom = 400;
    float percent = result.feedback.value;
    int barTop = static_cast<int>(math::interpolate(percent, 0.0f, 100.0f,
                                                    static_cast<float>(bottom), static_cast<float>(top)));

    cv::rectangle(canvas, cv::Point(30, top), cv::Point(55, bottom), cv::Scalar(209, 206, 0), 3);
    cv::rectangle(canvas, cv::Point(30, barTop), cv::Point(55, bottom), cv::Scalar(215, 255, 127), cv::FILLED);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d%%", static_cast<int>(percent));
    cv::putText(canvas, buf, cv::Point(25, bottom + 30), cv::FONT_HERSHEY_COMPLEX, 0.9, cv::Scalar(209, 206, 0), 2);
}

void DebugOverlay::drawScrollBar(cv::Mat& canvas, const core::TickResult& result) const {
    const int left = 200;
    const int width = 200;
    float speed = result.feedback.value;
    float maxSpeed = _config.scroll.speedMax * _config.scroll.adaptiveMax;
    int length = static_cast<int>(math::interpolate(speed, 0.0f, maxSpeed, 0.0f, static_cast<float>(width)));

    cv::rectangle(canvas, cv::Point(left, 410), cv::Point(left + length, 430), cv::Scalar(0, 255, 0), cv::FILLED);
    cv::rectangle(canvas, cv::Point(left, 410), cv::Point(left + width, 430), cv::Scalar(255, 255, 255), 2);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "Speed: %.1f", speed);
    cv::putText(canvas, buf, cv::Point(left, 405), cv::FONT_HERSHEY_COMPLEX_SMALL, 0.8, cv::Scalar(255, 255, 255), 1);

    if (result.scrollClicks) {
        bool up = *result.scrollClicks > 0;
        cv::putText(canvas, up ? "U" : "D", cv::Point(left + width + 15, 432), cv::FONT_HERSHEY_COMPLEX_SMALL, 2,
                    up ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255), 2);
    }
}

} // namespace render
