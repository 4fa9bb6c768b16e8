/*
 * PIO_I2C - PIO-based I2C master, software fallback for the Nunchuk bus
 * Open-drain via pindirs; SCL must be SDA + 1
 * Based on Raspberry Pi pico-examples pio/i2c (BSD-3-Clause)
 */

#ifndef PIO_I2C_HPP
#define PIO_I2C_HPP

#include "utils/i2c_bus.hpp"

#include "hardware/pio.h"

#include <cstdint>

class PIO_I2C final : public I2C_Bus {
public:
    bool init(PIO pio, uint sda_pin, uint scl_pin, uint freq_hz);
    void deinit();

    bool write_blocking(uint8_t addr, const uint8_t *data, uint32_t len) override;
    bool read_blocking(uint8_t addr, uint8_t *data, uint32_t len) override;

private:
    static constexpr uint8_t ICOUNT_LSB = 10;
    static constexpr uint8_t FINAL_LSB = 9;
    static constexpr uint8_t DATA_LSB = 1;
    static constexpr uint8_t NAK_LSB = 0;

    static constexpr uint32_t TIMEOUT_US = 10000;

    PIO pio_ = nullptr;
    uint sm_ = 0;
    uint offset_ = 0;
    uint sda_pin_ = 0;
    uint scl_pin_ = 0;
    bool error_ = false;

    void put16(uint16_t data);
    uint8_t get8();
    bool check_error();
    void clear_error();
    void start();
    void stop();
    void rx_enable(bool en);
    void wait_idle();
    bool abort_transfer();
};

#endif // PIO_I2C_HPP
