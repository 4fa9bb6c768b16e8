/*
 * Bus_Factory - Acquires an I2C bus on the sensor pins
 * Returns nullptr when the bus cannot be brought up at the given frequency
 */

#ifndef BUS_FACTORY_HPP
#define BUS_FACTORY_HPP

#include "i2c_bus.hpp"

#include <cstdint>

class Bus_Factory {
public:
    virtual ~Bus_Factory() = default;
    virtual I2C_Bus *acquire_hardware(uint32_t freq_hz) = 0;
    virtual I2C_Bus *acquire_software(uint32_t freq_hz) = 0;
};

#endif // BUS_FACTORY_HPP
