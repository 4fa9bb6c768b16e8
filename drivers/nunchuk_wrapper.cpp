/*
 * Nunchuk_Wrapper Implementation
 */

#include "drivers/nunchuk_wrapper.hpp"
#include "logic/nunchuk_math.hpp"

#include "pico/time.h"

#include <cstdio>

bool Nunchuk_Wrapper::begin(I2C_Bus &bus) {
    bus_ = &bus;
    initialized_ = handshake();
    ticks_since_handshake_ = 0;
    consecutive_failures = 0;
    return initialized_;
}

bool Nunchuk_Wrapper::read(RawSample &out) {
    if (bus_ == nullptr) {
        return false;
    }

    /* Late-connected sensor: retry the handshake at ~1Hz, not every tick */
    if (!initialized_) {
        if (++ticks_since_handshake_ < HANDSHAKE_RETRY_TICKS) {
            count_failure();
            return false;
        }
        ticks_since_handshake_ = 0;
        initialized_ = handshake();
        if (!initialized_) {
            count_failure();
            return false;
        }
        printf("[NUNCHUK] handshake OK (late connect)\n");
    }

    uint8_t reg = REG_DATA;
    if (!bus_->write_blocking(ADDR, &reg, 1)) {
        count_failure();
        return false;
    }
    sleep_us(NUNCHUK_READ_DELAY_US);

    uint8_t frame[NUNCHUK_FRAME_LEN] = {};
    if (!bus_->read_blocking(ADDR, frame, NUNCHUK_FRAME_LEN)) {
        count_failure();
        return false;
    }

    if (!nunchuk_decode(frame, &out)) {
        /* All-0xFF: peer lost its init (e.g. hot-replugged) */
        initialized_ = false;
        count_failure();
        return false;
    }

    consecutive_failures = 0;
    return true;
}

bool Nunchuk_Wrapper::handshake() {
    const uint8_t init1[2] = {REG_INIT_1, VAL_INIT_1};
    if (!bus_->write_blocking(ADDR, init1, sizeof(init1))) {
        return false;
    }
    sleep_ms(NUNCHUK_INIT_DELAY_1_MS);

    const uint8_t init2[2] = {REG_INIT_2, VAL_INIT_2};
    if (!bus_->write_blocking(ADDR, init2, sizeof(init2))) {
        return false;
    }
    sleep_ms(NUNCHUK_INIT_DELAY_2_MS);
    return true;
}

void Nunchuk_Wrapper::count_failure() {
    if (consecutive_failures < UINT16_MAX) { consecutive_failures++; }
}
