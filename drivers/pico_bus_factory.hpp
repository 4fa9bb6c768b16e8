/*
 * Pico_Bus_Factory - Bus_Factory over I2C0 and a PIO state machine
 * Owns both bus instances; at most one is active at a time
 */

#ifndef PICO_BUS_FACTORY_HPP
#define PICO_BUS_FACTORY_HPP

#include "types.h"
#include "drivers/hardware_i2c.hpp"
#include "drivers/pio_i2c.hpp"
#include "utils/bus_factory.hpp"
#include "utils/digital_line_control.hpp"

class Pico_Bus_Factory final : public Bus_Factory {
public:
    Pico_Bus_Factory(Digital_Line_Control &lines, const BusPins &pins);

    I2C_Bus *acquire_hardware(uint32_t freq_hz) override;
    I2C_Bus *acquire_software(uint32_t freq_hz) override;

private:
    Digital_Line_Control &lines_;
    const BusPins pins_;
    Hardware_I2C hardware_;
    PIO_I2C software_;

    bool lines_high();
};

#endif // PICO_BUS_FACTORY_HPP
