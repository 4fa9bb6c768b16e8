/*
 * Hardware_I2C - I2C_Bus over the RP2350 DW_apb_i2c block
 */

#ifndef HARDWARE_I2C_HPP
#define HARDWARE_I2C_HPP

#include "utils/i2c_bus.hpp"

#include "hardware/i2c.h"

#include <cstdint>

class Hardware_I2C final : public I2C_Bus {
public:
    bool init(i2c_inst_t *inst, uint sda_pin, uint scl_pin, uint freq_hz);
    void deinit();

    bool write_blocking(uint8_t addr, const uint8_t *data, uint32_t len) override;
    bool read_blocking(uint8_t addr, uint8_t *data, uint32_t len) override;

private:
    static constexpr uint32_t TIMEOUT_US = 5000;

    i2c_inst_t *inst_ = nullptr;
    uint sda_pin_ = 0;
    uint scl_pin_ = 0;
};

#endif // HARDWARE_I2C_HPP
