/*
 * Nunchuk_Wrapper - Wii Nunchuk driver over I2C_Bus
 * Unencrypted handshake, 6-byte polled reads at loop rate
 */

#ifndef NUNCHUK_WRAPPER_HPP
#define NUNCHUK_WRAPPER_HPP

#include "config.h"
#include "types.h"
#include "utils/i2c_bus.hpp"
#include "utils/sensor_source.hpp"

#include <cstdint>

class Nunchuk_Wrapper final : public Sensor_Source {
public:
    /*
     * Bind to the bus and run the handshake.
     * A failed handshake is not fatal: read() retries it until it succeeds.
     */
    bool begin(I2C_Bus &bus);

    bool read(RawSample &out) override;

    bool initialized() const { return initialized_; }

    uint16_t consecutive_failures = 0;

private:
    static constexpr uint8_t ADDR = NUNCHUK_I2C_ADDR;
    static constexpr uint8_t REG_INIT_1 = 0xF0;
    static constexpr uint8_t VAL_INIT_1 = 0x55;
    static constexpr uint8_t REG_INIT_2 = 0xFB;
    static constexpr uint8_t VAL_INIT_2 = 0x00;
    static constexpr uint8_t REG_DATA = 0x00;
    static constexpr uint16_t HANDSHAKE_RETRY_TICKS = 100;   /* ~1s at 100Hz */

    I2C_Bus *bus_ = nullptr;
    bool initialized_ = false;
    uint16_t ticks_since_handshake_ = 0;

    bool handshake();
    void count_failure();
};

#endif // NUNCHUK_WRAPPER_HPP
