/*
 * Wii Nunchuk Frame Decoding Implementation
 */

#include "logic/nunchuk_math.hpp"

bool nunchuk_decode(const uint8_t frame[NUNCHUK_FRAME_LEN], RawSample *out) {
    bool all_ones = true;
    for (uint8_t i = 0; i < NUNCHUK_FRAME_LEN; i++) {
        if (frame[i] != 0xFFU) {
            all_ones = false;
            break;
        }
    }
    if (all_ones) {
        return false;
    }

    out->axis_x = frame[0];
    out->axis_y = frame[1];
    out->button_a = (frame[5] & NUNCHUK_BTN_C_MASK) == 0U;
    out->button_b = (frame[5] & NUNCHUK_BTN_Z_MASK) == 0U;
    return true;
}

RawSample nunchuk_neutral_sample(int32_t center) {
    RawSample sample = {};
    uint8_t c = (center < 0) ? 0U : (center > 255) ? 255U : static_cast<uint8_t>(center);
    sample.axis_x = c;
    sample.axis_y = c;
    sample.button_a = false;
    sample.button_b = false;
    return sample;
}
