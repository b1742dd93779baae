#include <gtest/gtest.h>
#include "core/ProcessingLoop.hpp"
#include "HandPoses.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace core;
using namespace testing_poses;

namespace {

class RecordingSink : public ActionSink {
public:
    bool accept = true;

    bool setVolume(float level) override {
        std::lock_guard<std::mutex> lock(mutex);
        volumes.push_back(level);
        return accept;
    }

    bool scroll(int clicks) override {
        std::lock_guard<std::mutex> lock(mutex);
        scrolls.push_back(clicks);
        return accept;
    }

    bool publishFeedback(const FeedbackState& state) override {
        std::lock_guard<std::mutex> lock(mutex);
        feedback.push_back(state);
        return true;
    }

    size_t scrollCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return scrolls.size();
    }

    std::mutex mutex;
    std::vector<float> volumes;
    std::vector<int> scrolls;
    std::vector<FeedbackState> feedback;
};

} // namespace

class ProcessingLoopTest : public ::testing::Test {
protected:
    std::shared_ptr<LandmarkSlot> slot = std::make_shared<LandmarkSlot>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    TickClock clock;
};

TEST_F(ProcessingLoopTest, ProcessFrameDispatchesActions) {
    ProcessingLoop loop(slot, sink, getDefaultConfig(), ProcessingLoop::Config{});

    for (int i = 0; i < 5; ++i) {
        LandmarkFrame frame = makeHand(volume(), HandOrientation::Right, 125.0f);
        loop.processFrame(&frame, clock.advance());
    }

    EXPECT_EQ(loop.getTickCount(), 5u);
    EXPECT_EQ(loop.controller().getMode(), ControlMode::Volume);
    ASSERT_EQ(sink->volumes.size(), 1u);
    EXPECT_FLOAT_EQ(sink->volumes[0], 0.5f);
    EXPECT_TRUE(sink->scrolls.empty());
}

TEST_F(ProcessingLoopTest, FeedbackIsThrottledButModeChangesGoOut) {
    ProcessingLoop::Config config;
    config.feedbackRateHz = 10.0f;  // At most every 100ms
    ProcessingLoop loop(slot, sink, getDefaultConfig(), config);

    // 16ms ticks: the first tick publishes, then the commit on tick 5 forces one
    for (int i = 0; i < 5; ++i) {
        LandmarkFrame frame = makeHand(scrollUp());
        loop.processFrame(&frame, clock.advance());
    }
    ASSERT_EQ(sink->feedback.size(), 2u);
    EXPECT_EQ(sink->feedback[0].mode, ControlMode::Idle);
    EXPECT_EQ(sink->feedback[1].mode, ControlMode::Scroll);
}

TEST_F(ProcessingLoopTest, RejectedActionsAreCounted) {
    sink->accept = false;
    ProcessingLoop loop(slot, sink, getDefaultConfig(), ProcessingLoop::Config{});

    for (int i = 0; i < 8; ++i) {
        LandmarkFrame frame = makeHand(scrollUp());
        loop.processFrame(&frame, clock.advance());
    }

    EXPECT_EQ(loop.getActionFailures(), sink->scrolls.size());
    EXPECT_GT(loop.getActionFailures(), 0u);
    EXPECT_EQ(loop.controller().getMode(), ControlMode::Scroll);
}

TEST_F(ProcessingLoopTest, PreviewSeesEveryTick) {
    ProcessingLoop loop(slot, sink, getDefaultConfig(), ProcessingLoop::Config{});
    int previews = 0;
    int withHand = 0;
    loop.setPreviewCallback([&](const LandmarkFrame* frame, const TickResult&) {
        previews++;
        if (frame) withHand++;
    });

    LandmarkFrame frame = makeHand(fist());
    loop.processFrame(&frame, clock.advance());
    loop.processFrame(nullptr, clock.advance());

    EXPECT_EQ(previews, 2);
    EXPECT_EQ(withHand, 1);
}

TEST_F(ProcessingLoopTest, ThreadedLoopConsumesSlot) {
    ProcessingLoop::Config config;
    config.tickRateHz = 200.0f;
    config.staleFrameTimeout = std::chrono::milliseconds(500);
    ProcessingLoop loop(slot, sink, getDefaultConfig(), config);

    loop.start();
    EXPECT_TRUE(loop.isRunning());

    // Keep a fresh scroll pose in the slot until something is emitted
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (sink->scrollCount() == 0 && std::chrono::steady_clock::now() < deadline) {
        LandmarkFrame frame = makeHand(scrollUp());
        frame.timestamp = std::chrono::steady_clock::now();
        slot->publish(std::move(frame));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    loop.stop();
    EXPECT_FALSE(loop.isRunning());
    EXPECT_GT(sink->scrollCount(), 0u);
    EXPECT_EQ(loop.controller().getMode(), ControlMode::Scroll);
    EXPECT_GE(loop.getTickCount(), 5u);
}

TEST_F(ProcessingLoopTest, StaleFrameCountsAsNoHand) {
    ProcessingLoop::Config config;
    config.tickRateHz = 200.0f;
    config.staleFrameTimeout = std::chrono::milliseconds(20);
    ProcessingLoop loop(slot, sink, getDefaultConfig(), config);

    std::atomic<int> withHand{0};
    loop.setPreviewCallback([&](const LandmarkFrame* frame, const TickResult&) {
        if (frame) withHand++;
    });

    // Already older than the timeout when it arrives
    LandmarkFrame frame = makeHand(scrollUp());
    frame.timestamp = std::chrono::steady_clock::now() - std::chrono::seconds(1);
    slot->publish(std::move(frame));

    loop.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    loop.stop();

    EXPECT_EQ(withHand.load(), 0);
    EXPECT_TRUE(slot->empty());
    EXPECT_EQ(loop.controller().getMode(), ControlMode::Idle);
}

TEST_F(ProcessingLoopTest, SingleFrameIsObservedOnce) {
    ProcessingLoop loop(slot, sink, getDefaultConfig(), ProcessingLoop::Config{});

    std::atomic<int> withHand{0};
    loop.setPreviewCallback([&](const LandmarkFrame* frame, const TickResult&) {
        if (frame) withHand++;
    });

    // One detector frame, then silence for well over commitThreshold ticks at 60 Hz
    LandmarkFrame frame = makeHand(scrollUp());
    frame.timestamp = std::chrono::steady_clock::now();
    slot->publish(std::move(frame));

    loop.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    loop.stop();

    EXPECT_GE(loop.getTickCount(), 5u);
    EXPECT_EQ(withHand.load(), 1);
    EXPECT_EQ(loop.controller().getMode(), ControlMode::Idle);
    EXPECT_EQ(loop.controller().modeController().getStabilityCounter(), 1);
    EXPECT_EQ(sink->scrollCount(), 0u);
}

TEST_F(ProcessingLoopTest, MeasuresTickRateFromTickTimestamps) {
    ProcessingLoop loop(slot, sink, getDefaultConfig(), ProcessingLoop::Config{});
    EXPECT_FLOAT_EQ(loop.getMeasuredTickRate(), 0.0f);

    // 16ms steps: the first full second closes after 63 intervals (1008ms)
    for (int i = 0; i < 63; ++i) {
        loop.processFrame(nullptr, clock.advance());
    }
    EXPECT_FLOAT_EQ(loop.getMeasuredTickRate(), 0.0f);

    loop.processFrame(nullptr, clock.advance());
    EXPECT_NEAR(loop.getMeasuredTickRate(), 62.5f, 0.01f);

    // Slow down to 40ms ticks: the next window reports the slowdown
    auto start = clock.now();
    for (int i = 1; i <= 25; ++i) {
        loop.processFrame(nullptr, start + std::chrono::milliseconds(40 * i));
    }
    EXPECT_NEAR(loop.getMeasuredTickRate(), 25.0f, 0.01f);
}
