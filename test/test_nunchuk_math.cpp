/*
 * Unit tests for Nunchuk frame decoding
 */

#include <gtest/gtest.h>
#include "logic/nunchuk_math.hpp"

TEST(NunchukDecode, CenteredNoButtons) {
    const uint8_t frame[6] = {0x80, 0x7F, 0x12, 0x34, 0x56, 0x03};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_EQ(s.axis_x, 0x80);
    EXPECT_EQ(s.axis_y, 0x7F);
    EXPECT_FALSE(s.button_a);
    EXPECT_FALSE(s.button_b);
}

TEST(NunchukDecode, BothButtonsActiveLow) {
    const uint8_t frame[6] = {0x80, 0x80, 0, 0, 0, 0x00};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_TRUE(s.button_a);
    EXPECT_TRUE(s.button_b);
}

TEST(NunchukDecode, CMapsToButtonA) {
    // Bit1 (C) low, bit0 (Z) high
    const uint8_t frame[6] = {0x80, 0x80, 0, 0, 0, 0x01};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_TRUE(s.button_a);
    EXPECT_FALSE(s.button_b);
}

TEST(NunchukDecode, ZMapsToButtonB) {
    const uint8_t frame[6] = {0x80, 0x80, 0, 0, 0, 0x02};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_FALSE(s.button_a);
    EXPECT_TRUE(s.button_b);
}

TEST(NunchukDecode, AccelBitsInByte5Ignored) {
    // Upper six bits carry accelerometer LSBs
    const uint8_t frame[6] = {0x00, 0xFF, 0, 0, 0, 0xFC};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_EQ(s.axis_x, 0x00);
    EXPECT_EQ(s.axis_y, 0xFF);
    EXPECT_TRUE(s.button_a);
    EXPECT_TRUE(s.button_b);
}

TEST(NunchukDecode, AllOnesRejectedAndOutputUntouched) {
    const uint8_t frame[6] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    RawSample s = {10, 20, true, false};
    EXPECT_FALSE(nunchuk_decode(frame, &s));
    EXPECT_EQ(s.axis_x, 10);
    EXPECT_EQ(s.axis_y, 20);
    EXPECT_TRUE(s.button_a);
    EXPECT_FALSE(s.button_b);
}

TEST(NunchukDecode, FullDeflectionWithButtonsUpIsValid) {
    // Only the all-0xFF frame is treated as invalid
    const uint8_t frame[6] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE};
    RawSample s = {};
    ASSERT_TRUE(nunchuk_decode(frame, &s));
    EXPECT_FALSE(s.button_a);
    EXPECT_TRUE(s.button_b);
}

TEST(NunchukNeutral, CenteredReleased) {
    RawSample s = nunchuk_neutral_sample(128);
    EXPECT_EQ(s.axis_x, 128);
    EXPECT_EQ(s.axis_y, 128);
    EXPECT_FALSE(s.button_a);
    EXPECT_FALSE(s.button_b);
}

TEST(NunchukNeutral, CenterClampedToByte) {
    EXPECT_EQ(nunchuk_neutral_sample(-5).axis_x, 0);
    EXPECT_EQ(nunchuk_neutral_sample(300).axis_y, 255);
}
