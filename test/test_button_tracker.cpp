/*
 * Unit tests for the tap/hold button tracker
 */

#include <gtest/gtest.h>
#include "logic/button_tracker.hpp"

static constexpr uint32_t TAP_MS = 300;

class ButtonTrackerTest : public ::testing::Test {
protected:
    ButtonTracker tracker = {};

    ButtonEvent step(bool pressed, uint32_t now, bool moved = false) {
        return button_tracker_update(tracker, pressed, now, moved, TAP_MS);
    }
};

TEST_F(ButtonTrackerTest, IdleEmitsNothing) {
    EXPECT_EQ(step(false, 0), ButtonEvent::None);
    EXPECT_EQ(step(false, 1000), ButtonEvent::None);
    EXPECT_FALSE(tracker.is_pressed);
}

TEST_F(ButtonTrackerTest, PressEdgeEmitsNothingAndResets) {
    tracker.was_held = true;
    tracker.moved_during_press = true;
    EXPECT_EQ(step(true, 500), ButtonEvent::None);
    EXPECT_TRUE(tracker.is_pressed);
    EXPECT_EQ(tracker.press_time_ms, 500U);
    EXPECT_FALSE(tracker.was_held);
    EXPECT_FALSE(tracker.moved_during_press);
}

TEST_F(ButtonTrackerTest, ShortPressIsTap) {
    step(true, 0);
    EXPECT_EQ(step(true, 100), ButtonEvent::None);
    EXPECT_EQ(step(false, 200), ButtonEvent::Tap);
    EXPECT_FALSE(tracker.is_pressed);
}

TEST_F(ButtonTrackerTest, ReleaseExactlyAtThresholdIsTap) {
    step(true, 0);
    EXPECT_EQ(step(false, 300), ButtonEvent::Tap);
}

TEST_F(ButtonTrackerTest, HoldStartOnceThenHoldEnd) {
    step(true, 0);
    EXPECT_EQ(step(true, 300), ButtonEvent::None);
    EXPECT_EQ(step(true, 310), ButtonEvent::HoldStart);
    EXPECT_TRUE(tracker.was_held);
    EXPECT_EQ(step(true, 320), ButtonEvent::None);
    EXPECT_EQ(step(true, 2000), ButtonEvent::None);
    EXPECT_EQ(step(false, 2010), ButtonEvent::HoldEnd);
}

TEST_F(ButtonTrackerTest, HoldEndRegardlessOfMovement) {
    step(true, 0);
    step(true, 310, true);
    EXPECT_EQ(step(false, 400, true), ButtonEvent::HoldEnd);
}

TEST_F(ButtonTrackerTest, ShortPressWithMovementIsNotTap) {
    step(true, 0);
    step(true, 50, true);
    EXPECT_TRUE(tracker.moved_during_press);
    EXPECT_EQ(step(true, 100, false), ButtonEvent::None);
    // Movement is sticky for the episode
    EXPECT_TRUE(tracker.moved_during_press);
    EXPECT_EQ(step(false, 150), ButtonEvent::None);
}

TEST_F(ButtonTrackerTest, ReleaseAfterThresholdWithoutHoldTickIsSilent) {
    // Press and release with no intermediate tick past the threshold:
    // too long for a tap, never reported as a hold.
    step(true, 0);
    EXPECT_EQ(step(false, 400), ButtonEvent::None);
}

TEST_F(ButtonTrackerTest, NewEpisodeClearsPreviousFlags) {
    step(true, 0);
    step(true, 50, true);
    step(true, 400);
    step(false, 410);

    EXPECT_EQ(step(true, 1000), ButtonEvent::None);
    EXPECT_FALSE(tracker.was_held);
    EXPECT_FALSE(tracker.moved_during_press);
    EXPECT_EQ(step(false, 1100), ButtonEvent::Tap);
}

TEST_F(ButtonTrackerTest, MovementBeforePressDoesNotCount) {
    step(false, 0, true);
    step(true, 10, true);    // Press edge ignores stick_moved
    EXPECT_FALSE(tracker.moved_during_press);
    EXPECT_EQ(step(false, 100), ButtonEvent::Tap);
}

TEST_F(ButtonTrackerTest, TimestampWrapAround) {
    // 0xFFFFFF00 -> 0x0000002C is 300ms
    step(true, 0xFFFFFF00U);
    EXPECT_EQ(step(true, 0x0000002CU), ButtonEvent::None);
    EXPECT_EQ(step(true, 0x0000002DU), ButtonEvent::HoldStart);
}

TEST_F(ButtonTrackerTest, HoldActiveHelper) {
    EXPECT_FALSE(button_hold_active(tracker));
    step(true, 0);
    EXPECT_FALSE(button_hold_active(tracker));
    step(true, 310);
    EXPECT_TRUE(button_hold_active(tracker));
    step(false, 320);
    EXPECT_FALSE(button_hold_active(tracker));
}

TEST_F(ButtonTrackerTest, IndependentTrackers) {
    ButtonTracker other = {};
    step(true, 0);
    button_tracker_update(other, true, 200, false, TAP_MS);
    EXPECT_EQ(step(true, 310), ButtonEvent::HoldStart);
    EXPECT_EQ(button_tracker_update(other, true, 310, false, TAP_MS), ButtonEvent::None);
    EXPECT_EQ(button_tracker_update(other, false, 320, false, TAP_MS), ButtonEvent::Tap);
}
