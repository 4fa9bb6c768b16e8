/*
 * I2C_Bus - Master-side transfer interface
 * Implemented by the hardware I2C block and the PIO software fallback
 */

#ifndef I2C_BUS_HPP
#define I2C_BUS_HPP

#include <cstdint>

class I2C_Bus {
public:
    virtual ~I2C_Bus() = default;
    virtual bool write_blocking(uint8_t addr, const uint8_t *data, uint32_t len) = 0;
    virtual bool read_blocking(uint8_t addr, uint8_t *data, uint32_t len) = 0;

    /* Address ACK check via a 1-byte read */
    bool probe(uint8_t addr) {
        uint8_t dummy = 0;
        return read_blocking(addr, &dummy, 1);
    }
};

#endif // I2C_BUS_HPP
