/*
 * Pico_Bus_Factory Implementation
 */

#include "drivers/pico_bus_factory.hpp"
#include "logic/bus_recovery.hpp"
#include "config.h"

#include "hardware/i2c.h"

#include <cstdio>

Pico_Bus_Factory::Pico_Bus_Factory(Digital_Line_Control &lines, const BusPins &pins)
    : lines_(lines), pins_(pins) {}

I2C_Bus *Pico_Bus_Factory::acquire_hardware(uint32_t freq_hz) {
    software_.deinit();
    hardware_.deinit();

    /* Pulled down internally, both lines must still read high: external
     * pull-ups present and no peer holding the bus */
    if (!bus_lines_idle(lines_, pins_, LinePull::Down)) {
        printf("[I2C] SDA/SCL not idle-high (missing pull-up or stuck bus)\n");
        return nullptr;
    }

    if (!hardware_.init(i2c_get_instance(NUNCHUK_I2C_NUM), pins_.sda, pins_.scl, freq_hz)) {
        return nullptr;
    }
    return &hardware_;
}

I2C_Bus *Pico_Bus_Factory::acquire_software(uint32_t freq_hz) {
    hardware_.deinit();
    software_.deinit();

    if (!software_.init(NUNCHUK_PIO_INSTANCE, pins_.sda, pins_.scl, freq_hz)) {
        printf("[I2C] no free PIO state machine / instruction space\n");
        return nullptr;
    }

    /* Internal pull-ups are on now; a line still low is held by the peer */
    if (!lines_high()) {
        printf("[I2C] line held low with PIO bus at %lu Hz\n",
               static_cast<unsigned long>(freq_hz));
        software_.deinit();
        return nullptr;
    }
    return &software_;
}

bool Pico_Bus_Factory::lines_high() {
    return lines_.get(pins_.sda) && lines_.get(pins_.scl);
}
