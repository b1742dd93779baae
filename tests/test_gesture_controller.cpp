#include <gtest/gtest.h>
#include "core/GestureController.hpp"
#include "HandPoses.hpp"
#include <limits>
#include <vector>

using namespace core;
using namespace testing_poses;

namespace {

class RecordingSink : public ActionSink {
public:
    bool accept = true;
    std::vector<float> volumes;
    std::vector<int> scrolls;

    bool setVolume(float level) override {
        volumes.push_back(level);
        return accept;
    }

    bool scroll(int clicks) override {
        scrolls.push_back(clicks);
        return accept;
    }
};

} // namespace

class GestureControllerTest : public ::testing::Test {
protected:
    GestureController controller;
    TickClock clock;

    TickResult tickPose(const FingerState& fingers, float pinch = 80.0f, float spread = 60.0f,
                        HandOrientation orientation = HandOrientation::Right) {
        LandmarkFrame frame = makeHand(fingers, orientation, pinch, spread);
        frame.timestamp = clock.advance();
        return controller.tick(frame);
    }

    TickResult tickNoHand() {
        return controller.tick(nullptr, clock.advance());
    }

    void commit(const FingerState& fingers, float pinch = 80.0f) {
        for (int i = 0; i < controller.config().gesture.commitThreshold; ++i) {
            tickPose(fingers, pinch);
        }
    }
};

TEST_F(GestureControllerTest, StartsIdle) {
    EXPECT_EQ(controller.getMode(), ControlMode::Idle);
    auto result = tickNoHand();
    EXPECT_EQ(result.mode, ControlMode::Idle);
    EXPECT_EQ(result.gesture, GestureLabel::Unknown);
    EXPECT_FALSE(result.reading.has_value());
    EXPECT_FALSE(result.volumeLevel.has_value());
    EXPECT_FALSE(result.scrollClicks.has_value());
}

TEST_F(GestureControllerTest, ScrollUpSessionCoastsToRest) {
    for (int i = 1; i <= 4; ++i) {
        auto result = tickPose(scrollUp());
        EXPECT_EQ(result.gesture, GestureLabel::ScrollUp);
        EXPECT_EQ(result.mode, ControlMode::Idle) << "tick " << i;
        EXPECT_FALSE(result.scrollClicks.has_value());
    }

    auto committed = tickPose(scrollUp());
    ASSERT_TRUE(committed.transition.has_value());
    EXPECT_EQ(committed.transition->to, ControlMode::Scroll);
    EXPECT_EQ(committed.mode, ControlMode::Scroll);
    ASSERT_TRUE(committed.scrollClicks.has_value());
    EXPECT_GT(*committed.scrollClicks, 0);

    for (int i = 0; i < 20; ++i) {
        auto result = tickPose(scrollUp());
        if (result.scrollClicks) {
            EXPECT_GT(*result.scrollClicks, 0);
        }
    }

    // Hand drops out: mode holds, momentum coasts down and stops
    std::optional<int> last;
    for (int i = 0; i < 300; ++i) {
        auto result = tickNoHand();
        EXPECT_EQ(result.mode, ControlMode::Scroll);
        if (result.scrollClicks) {
            EXPECT_GT(*result.scrollClicks, 0);
        }
        last = result.scrollClicks;
    }
    EXPECT_FALSE(last.has_value());
    EXPECT_FLOAT_EQ(controller.scrollMomentum().getMomentum(), 0.0f);
}

TEST_F(GestureControllerTest, ScrollDownEmitsNegativeClicks) {
    commit(scrollDown());
    ASSERT_EQ(controller.getMode(), ControlMode::Scroll);

    for (int i = 0; i < 10; ++i) {
        auto result = tickPose(scrollDown());
        if (result.scrollClicks) {
            EXPECT_LT(*result.scrollClicks, 0);
        }
    }
}

TEST(GestureControllerSpeedTest, WiderFingersScrollFaster) {
    auto commitClicks = [](float spread) {
        GestureController controller;
        TickClock clock;
        std::optional<int> clicks;
        for (int i = 0; i < 5; ++i) {
            LandmarkFrame frame = makeHand(scrollUp(), HandOrientation::Right, 80.0f, spread);
            frame.timestamp = clock.advance();
            clicks = controller.tick(frame).scrollClicks;
        }
        return clicks;
    };

    auto slow = commitClicks(40.0f);
    auto fast = commitClicks(180.0f);
    ASSERT_TRUE(slow.has_value());
    ASSERT_TRUE(fast.has_value());
    EXPECT_EQ(*slow, 2);
    EXPECT_EQ(*fast, 17);
}

TEST_F(GestureControllerTest, VolumeFollowsPinch) {
    commit(volume(), 125.0f);
    ASSERT_EQ(controller.getMode(), ControlMode::Volume);

    for (int i = 0; i < 15; ++i) {
        tickPose(volume(), 200.0f);
    }
    auto open = tickPose(volume(), 200.0f);
    ASSERT_TRUE(open.volumeLevel.has_value());
    EXPECT_FLOAT_EQ(*open.volumeLevel, 1.0f);

    auto partial = tickPose(volume(), 125.0f);
    ASSERT_TRUE(partial.volumeLevel.has_value());
    EXPECT_GT(*partial.volumeLevel, 0.5f);
    EXPECT_LT(*partial.volumeLevel, 1.0f);
}

TEST_F(GestureControllerTest, VolumeOnCommitTick) {
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(tickPose(volume(), 125.0f).volumeLevel.has_value());
    }
    auto committed = tickPose(volume(), 125.0f);
    ASSERT_TRUE(committed.transition.has_value());
    ASSERT_TRUE(committed.volumeLevel.has_value());
    EXPECT_FLOAT_EQ(*committed.volumeLevel, 0.5f);
}

TEST_F(GestureControllerTest, ClosedPinchReachesMinimum) {
    commit(volume(), 150.0f);
    ASSERT_EQ(controller.getMode(), ControlMode::Volume);

    // Below minVolumePinch the pose reads Unknown, but the mode holds
    auto closed = tickPose(volume(), 10.0f);
    EXPECT_EQ(closed.gesture, GestureLabel::Unknown);
    EXPECT_EQ(closed.mode, ControlMode::Volume);
    ASSERT_TRUE(closed.volumeLevel.has_value());
    EXPECT_FLOAT_EQ(*closed.volumeLevel, 0.0f);
}

TEST_F(GestureControllerTest, LeftHandControlsVolume) {
    for (int i = 0; i < 5; ++i) {
        tickPose(volume(), 150.0f, 60.0f, HandOrientation::Left);
    }
    EXPECT_EQ(controller.getMode(), ControlMode::Volume);
    EXPECT_NEAR(controller.volumeMapper().getLastLevel(), 100.0f / 150.0f, 1e-4f);
}

TEST_F(GestureControllerTest, FistEndsVolumeAndResets) {
    commit(volume(), 150.0f);
    ASSERT_EQ(controller.getMode(), ControlMode::Volume);

    for (int i = 0; i < 4; ++i) {
        auto result = tickPose(fist());
        EXPECT_EQ(result.mode, ControlMode::Volume);
        EXPECT_FALSE(result.volumeLevel.has_value());
    }

    auto exit = tickPose(fist());
    ASSERT_TRUE(exit.transition.has_value());
    EXPECT_EQ(exit.transition->from, ControlMode::Volume);
    EXPECT_EQ(exit.transition->to, ControlMode::Idle);
    EXPECT_FALSE(exit.volumeLevel.has_value());

    EXPECT_TRUE(controller.distanceHistory().empty());
    EXPECT_FALSE(controller.volumeMapper().hasSmoothedDistance());
    EXPECT_FLOAT_EQ(controller.scrollMomentum().getMomentum(), 0.0f);
    EXPECT_FLOAT_EQ(controller.scrollMomentum().getAdaptiveSpeed(), 1.0f);
}

TEST_F(GestureControllerTest, NoHandKeepsPendingCandidate) {
    for (int i = 0; i < 3; ++i) tickPose(scrollUp());
    for (int i = 0; i < 10; ++i) tickNoHand();

    EXPECT_EQ(controller.getMode(), ControlMode::Idle);
    EXPECT_EQ(controller.modeController().getStabilityCounter(), 3);

    tickPose(scrollUp());
    auto result = tickPose(scrollUp());
    EXPECT_TRUE(result.transition.has_value());
    EXPECT_EQ(controller.getMode(), ControlMode::Scroll);
}

TEST_F(GestureControllerTest, MalformedFrameIsNoHand) {
    commit(scrollUp());

    LandmarkFrame shortFrame = makeHand(scrollUp());
    shortFrame.landmarks.resize(7);
    shortFrame.timestamp = clock.advance();

    auto result = controller.tick(shortFrame);
    EXPECT_FALSE(result.reading.has_value());
    EXPECT_EQ(result.gesture, GestureLabel::Unknown);
    EXPECT_EQ(result.mode, ControlMode::Scroll);
}

TEST_F(GestureControllerTest, NaNFrameEmitsNothing) {
    commit(volume(), 125.0f);

    LandmarkFrame broken = makeHand(volume(), HandOrientation::Right, 125.0f);
    broken.landmarks[LandmarkIndices::THUMB_TIP].x = std::numeric_limits<float>::quiet_NaN();
    broken.timestamp = clock.advance();

    auto result = controller.tick(broken);
    EXPECT_FALSE(result.reading.has_value());
    EXPECT_FALSE(result.volumeLevel.has_value());
    EXPECT_EQ(result.mode, ControlMode::Volume);
}

TEST_F(GestureControllerTest, DirectScrollToVolume) {
    commit(scrollUp());
    tickPose(scrollUp());
    ASSERT_TRUE(controller.scrollMomentum().isCoasting());

    TickResult result;
    for (int i = 0; i < 5; ++i) {
        result = tickPose(volume(), 125.0f);
    }
    ASSERT_TRUE(result.transition.has_value());
    EXPECT_EQ(result.transition->from, ControlMode::Scroll);
    EXPECT_EQ(result.transition->to, ControlMode::Volume);
    EXPECT_FALSE(result.scrollClicks.has_value());
    EXPECT_FLOAT_EQ(controller.scrollMomentum().getMomentum(), 0.0f);
    EXPECT_TRUE(result.volumeLevel.has_value());
}

TEST_F(GestureControllerTest, OneActionKindPerTick) {
    commit(volume(), 150.0f);
    for (int i = 0; i < 30; ++i) {
        auto result = (i % 3 == 0) ? tickPose(scrollUp()) : tickPose(volume(), 150.0f);
        EXPECT_FALSE(result.volumeLevel && result.scrollClicks);
    }
}

TEST_F(GestureControllerTest, FeedbackReflectsMode) {
    auto pending = tickPose(volume(), 125.0f);
    EXPECT_EQ(pending.feedback.mode, ControlMode::Idle);
    EXPECT_EQ(pending.feedback.gesture, GestureLabel::Volume);
    EXPECT_FLOAT_EQ(pending.feedback.confidence, 0.2f);
    EXPECT_FLOAT_EQ(pending.feedback.value, 0.0f);

    for (int i = 0; i < 4; ++i) tickPose(volume(), 125.0f);
    FeedbackState feedback = controller.getFeedback();
    EXPECT_EQ(feedback.mode, ControlMode::Volume);
    EXPECT_FLOAT_EQ(feedback.confidence, 1.0f);
    EXPECT_FLOAT_EQ(feedback.value, 50.0f);
    EXPECT_FLOAT_EQ(feedback.stability, 1.0f);
}

TEST_F(GestureControllerTest, ResetReturnsToInitialState) {
    commit(scrollUp());
    tickPose(scrollUp());
    controller.reset();

    EXPECT_EQ(controller.getMode(), ControlMode::Idle);
    EXPECT_EQ(controller.gestureHistory().size(), 0u);
    EXPECT_TRUE(controller.distanceHistory().empty());
    EXPECT_FALSE(controller.scrollMomentum().isCoasting());
}

TEST(ActionDispatchTest, RejectedActionsAreCountedNotFedBack) {
    GestureController accepted;
    GestureController rejected;
    RecordingSink okSink;
    RecordingSink failingSink;
    failingSink.accept = false;

    TickClock clock;
    int failures = 0;
    for (int i = 0; i < 40; ++i) {
        LandmarkFrame frame = makeHand(i < 20 ? scrollUp() : volume(), HandOrientation::Right, 120.0f);
        frame.timestamp = clock.advance();

        EXPECT_EQ(dispatchActions(accepted.tick(frame), okSink), 0);
        failures += dispatchActions(rejected.tick(frame), failingSink);
    }

    EXPECT_EQ(failures, static_cast<int>(failingSink.volumes.size() + failingSink.scrolls.size()));
    EXPECT_GT(failures, 0);
    EXPECT_EQ(okSink.scrolls, failingSink.scrolls);
    EXPECT_EQ(okSink.volumes, failingSink.volumes);
    EXPECT_EQ(accepted.getMode(), rejected.getMode());
    EXPECT_FLOAT_EQ(accepted.scrollMomentum().getMomentum(), rejected.scrollMomentum().getMomentum());
}

TEST(ActionDispatchTest, NothingToDispatch) {
    RecordingSink sink;
    TickResult empty;
    EXPECT_EQ(dispatchActions(empty, sink), 0);
    EXPECT_TRUE(sink.volumes.empty());
    EXPECT_TRUE(sink.scrolls.empty());
}
