/*
 * Unit tests for per-tick mode dispatch
 * Taps, drag/orbit latching, neutral pan and scroll
 */

#include <gtest/gtest.h>
#include "logic/mode_dispatcher.hpp"
#include "test_fakes.hpp"

static constexpr uint8_t C = JOY_CENTER;

class ModeDispatcherTest : public ::testing::Test {
protected:
    ControllerConfig config = {};
    Fake_Output output;
    Mode_Dispatcher dispatcher{config, output};
    uint32_t now = 0;

    /* One 10ms tick */
    TickReport tick(uint8_t x, uint8_t y, bool a, bool b) {
        TickReport r = dispatcher.tick(RawSample{x, y, a, b}, now);
        now += 10;
        return r;
    }

    /* Hold a button past the tap threshold with the stick centered */
    void hold(bool a, bool b) {
        for (int i = 0; i < 32; i++) {
            tick(C, C, a, b);
        }
    }
};

// ============================================================================
// Taps
// ============================================================================

TEST_F(ModeDispatcherTest, TapAEmitsKeyA) {
    tick(C, C, true, false);
    tick(C, C, true, false);
    TickReport r = tick(C, C, false, false);

    EXPECT_EQ(r.event_a, ButtonEvent::Tap);
    EXPECT_EQ(output.log, (std::vector<std::string>{"press_key 0x09", "release_key 0x09"}));
}

TEST_F(ModeDispatcherTest, TapBEmitsKeyB) {
    tick(C, C, false, true);
    TickReport r = tick(C, C, false, false);

    EXPECT_EQ(r.event_b, ButtonEvent::Tap);
    EXPECT_EQ(output.log, (std::vector<std::string>{"press_key 0x07", "release_key 0x07"}));
}

TEST_F(ModeDispatcherTest, ConfiguredTapKeys) {
    config.tap_key_a = 0x1D;   // 'Z'
    Mode_Dispatcher custom(config, output);
    custom.tick(RawSample{C, C, true, false}, 0);
    custom.tick(RawSample{C, C, false, false}, 50);
    EXPECT_EQ(output.log, (std::vector<std::string>{"press_key 0x1D", "release_key 0x1D"}));
}

TEST_F(ModeDispatcherTest, ShortPressWithStickMovementNoTap) {
    tick(C, C, true, false);
    tick(255, C, true, false);
    tick(C, C, false, false);

    EXPECT_EQ(output.count("press_key 0x09"), 0);
}

// ============================================================================
// Drag / orbit holds
// ============================================================================

TEST_F(ModeDispatcherTest, HoldAEndToEnd) {
    // 0.5s hold, threshold 0.3s, stick centered
    int hold_starts = 0;
    int none_before_hold = 0;
    for (uint32_t t = 0; t <= 500; t += 10) {
        TickReport r = tick(C, C, true, false);
        if (r.event_a == ButtonEvent::HoldStart) {
            hold_starts++;
        } else if (hold_starts == 0) {
            EXPECT_EQ(r.event_a, ButtonEvent::None);
            none_before_hold++;
        }
    }
    TickReport end = tick(C, C, false, false);

    EXPECT_EQ(hold_starts, 1);
    EXPECT_EQ(none_before_hold, 31);
    EXPECT_EQ(end.event_a, ButtonEvent::HoldEnd);
    EXPECT_EQ(output.log, (std::vector<std::string>{"press_button L", "release_button L"}));
    EXPECT_FALSE(dispatcher.latch().left_button_down);
}

TEST_F(ModeDispatcherTest, DragLatchesOnceAndMovesInvertedY) {
    hold(true, false);
    EXPECT_TRUE(dispatcher.latch().left_button_down);

    TickReport r = tick(255, 0, true, false);
    tick(255, 0, true, false);

    EXPECT_EQ(r.mode, DispatchMode::Drag);
    EXPECT_EQ(output.count("press_button L"), 1);
    // x: 102*15/103 = 14; y: stick down (0) -> -15, inverted to +15
    EXPECT_EQ(output.count("move 14,15,0"), 2);
}

TEST_F(ModeDispatcherTest, DragCenteredSendsNoMotion) {
    hold(true, false);
    tick(C, C, true, false);
    for (const std::string &cmd : output.log) {
        EXPECT_EQ(cmd.rfind("move", 0), std::string::npos) << cmd;
    }
}

TEST_F(ModeDispatcherTest, OrbitUsesRightButtonAndOrbitSensitivity) {
    hold(false, true);
    TickReport r = tick(255, C, false, true);
    TickReport end = tick(C, C, false, false);

    EXPECT_EQ(r.mode, DispatchMode::Orbit);
    EXPECT_EQ(end.event_b, ButtonEvent::HoldEnd);
    EXPECT_EQ(output.log, (std::vector<std::string>{
                              "press_button R", "move 11,0,0", "release_button R"}));
}

TEST_F(ModeDispatcherTest, DragWinsOverOrbit) {
    hold(true, true);
    TickReport r = tick(255, C, true, true);

    EXPECT_EQ(r.mode, DispatchMode::Drag);
    EXPECT_TRUE(dispatcher.latch().left_button_down);
    EXPECT_FALSE(dispatcher.latch().right_button_down);
    EXPECT_EQ(output.count("press_button R"), 0);
}

TEST_F(ModeDispatcherTest, OrbitTakesOverWhenDragEnds) {
    hold(true, true);
    TickReport r = tick(C, C, false, true);   // A HoldEnd, B still held

    EXPECT_EQ(r.event_a, ButtonEvent::HoldEnd);
    EXPECT_EQ(r.mode, DispatchMode::Orbit);
    EXPECT_FALSE(dispatcher.latch().left_button_down);
    EXPECT_TRUE(dispatcher.latch().right_button_down);
    // Orbit latches on the same tick; left release still goes out last
    EXPECT_EQ(output.log, (std::vector<std::string>{
                              "press_button L", "press_button R", "release_button L"}));
}

TEST_F(ModeDispatcherTest, ReleaseComesAfterFinalMotion) {
    hold(true, false);
    output.log.clear();

    // Release while deflected: this tick's pan goes out, left release last
    TickReport r = tick(255, C, false, false);

    EXPECT_EQ(r.event_a, ButtonEvent::HoldEnd);
    EXPECT_EQ(r.mode, DispatchMode::Neutral);
    EXPECT_EQ(output.log, (std::vector<std::string>{
                              "press_key 0xE1", "press_button R", "move 14,0,0",
                              "release_button R", "release_key 0xE1", "release_button L"}));
}

TEST_F(ModeDispatcherTest, OrbitReleaseTickSuppressesPan) {
    hold(false, true);
    output.log.clear();

    // Right still latched: pan would press/release the same button
    TickReport r = tick(255, C, false, false);

    EXPECT_EQ(r.event_b, ButtonEvent::HoldEnd);
    EXPECT_EQ(r.mode, DispatchMode::Neutral);
    EXPECT_EQ(output.log, (std::vector<std::string>{"release_button R"}));
    EXPECT_FALSE(dispatcher.latch().right_button_down);
}

TEST_F(ModeDispatcherTest, ScrollStillRunsOnOrbitReleaseTick) {
    hold(false, true);
    output.log.clear();

    tick(255, 255, false, false);

    EXPECT_EQ(output.log, (std::vector<std::string>{"move 0,0,3", "release_button R"}));
}

// ============================================================================
// Neutral: pan and scroll
// ============================================================================

TEST_F(ModeDispatcherTest, CenteredNeutralIsSilent) {
    TickReport r = tick(C, C, false, false);
    EXPECT_EQ(r.mode, DispatchMode::Neutral);
    EXPECT_FALSE(r.stick_moved);
    EXPECT_TRUE(output.log.empty());
}

TEST_F(ModeDispatcherTest, PanSequence) {
    TickReport r = tick(255, C, false, false);

    EXPECT_TRUE(r.stick_moved);
    EXPECT_EQ(output.log, (std::vector<std::string>{
                              "press_key 0xE1", "press_button R", "move 14,0,0",
                              "release_button R", "release_key 0xE1"}));
}

TEST_F(ModeDispatcherTest, PanLeft) {
    tick(0, C, false, false);
    EXPECT_EQ(output.count("move -15,0,0"), 1);
}

TEST_F(ModeDispatcherTest, ScrollUpAndDown) {
    tick(C, 255, false, false);
    tick(C, 0, false, false);
    EXPECT_EQ(output.log, (std::vector<std::string>{"move 0,0,3", "move 0,0,-3"}));
}

TEST_F(ModeDispatcherTest, ScrollThenPanOnDiagonal) {
    tick(0, 255, false, false);
    EXPECT_EQ(output.log, (std::vector<std::string>{
                              "move 0,0,3", "press_key 0xE1", "press_button R",
                              "move -15,0,0", "release_button R", "release_key 0xE1"}));
}

TEST_F(ModeDispatcherTest, NearDeadzoneEdgeNoOutput) {
    // Outside dead zone but both scaled and scroll values truncate to 0
    TickReport r = tick(154, C, false, false);
    EXPECT_TRUE(r.stick_moved);
    EXPECT_TRUE(output.log.empty());
}

TEST_F(ModeDispatcherTest, TapKeyBeforePanOnSameTick) {
    tick(C, C, false, true);
    TickReport r = tick(255, C, false, false);

    EXPECT_EQ(r.event_b, ButtonEvent::Tap);
    ASSERT_GE(output.log.size(), 3U);
    EXPECT_EQ(output.log[0], "press_key 0x07");
    EXPECT_EQ(output.log[1], "release_key 0x07");
    EXPECT_EQ(output.log[2], "press_key 0xE1");
}
