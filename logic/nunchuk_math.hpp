/*
 * Wii Nunchuk Frame Decoding - Pure Algorithms (no SDK dependencies)
 * 6-byte unencrypted report (after 0xF0=0x55, 0xFB=0x00 handshake)
 */

#ifndef NUNCHUK_MATH_HPP
#define NUNCHUK_MATH_HPP

#include "types.h"

#include <cstdint>

static constexpr uint8_t NUNCHUK_FRAME_LEN = 6;
static constexpr uint8_t NUNCHUK_BTN_Z_MASK = 0x01;   /* Byte 5, active low */
static constexpr uint8_t NUNCHUK_BTN_C_MASK = 0x02;   /* Byte 5, active low */

/*
 * Decode a raw frame into a sample.
 * Byte 0 = stick X, byte 1 = stick Y, byte 5 bits 0/1 = Z/C (0 = pressed).
 * C maps to button A, Z to button B.
 *
 * Returns false for an all-0xFF frame (peer not initialised or not
 * driving the bus); *out is left untouched in that case.
 */
bool nunchuk_decode(const uint8_t frame[NUNCHUK_FRAME_LEN], RawSample *out);

/* Stick centered, both buttons released */
RawSample nunchuk_neutral_sample(int32_t center);

#endif // NUNCHUK_MATH_HPP
