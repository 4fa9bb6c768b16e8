/*
 * Hardware_I2C Implementation
 */

#include "drivers/hardware_i2c.hpp"

#include "hardware/gpio.h"

#include <cstdio>

bool Hardware_I2C::init(i2c_inst_t *inst, uint sda_pin, uint scl_pin, uint freq_hz) {
    uint actual = i2c_init(inst, freq_hz);
    if (actual == 0) {
        return false;
    }

    gpio_set_function(sda_pin, GPIO_FUNC_I2C);
    gpio_set_function(scl_pin, GPIO_FUNC_I2C);
    gpio_pull_up(sda_pin);
    gpio_pull_up(scl_pin);

    inst_ = inst;
    sda_pin_ = sda_pin;
    scl_pin_ = scl_pin;

    printf("[I2C] hardware i2c%u at %u Hz (requested %u)\n",
           i2c_get_index(inst), actual, freq_hz);
    return true;
}

void Hardware_I2C::deinit() {
    if (inst_ == nullptr) {
        return;
    }
    i2c_deinit(inst_);
    gpio_deinit(sda_pin_);
    gpio_deinit(scl_pin_);
    inst_ = nullptr;
}

bool Hardware_I2C::write_blocking(uint8_t addr, const uint8_t *data, uint32_t len) {
    if (inst_ == nullptr) {
        return false;
    }
    // Returns bytes written or PICO_ERROR_GENERIC/PICO_ERROR_TIMEOUT
    int ret = i2c_write_timeout_us(inst_, addr, data, len, false, TIMEOUT_US);
    return ret == static_cast<int>(len);
}

bool Hardware_I2C::read_blocking(uint8_t addr, uint8_t *data, uint32_t len) {
    if (inst_ == nullptr) {
        return false;
    }
    int ret = i2c_read_timeout_us(inst_, addr, data, len, false, TIMEOUT_US);
    return ret == static_cast<int>(len);
}
