/*
 * Pico_Clock - Clock_Source over the RP2350 64-bit microsecond timer
 */

#ifndef PICO_CLOCK_HPP
#define PICO_CLOCK_HPP

#include "utils/clock_source.hpp"

class Pico_Clock final : public Clock_Source {
public:
    uint32_t now_ms() override;
    uint64_t now_us() override;
    void sleep_ms(uint32_t ms) override;
    void sleep_us(uint64_t us) override;
};

#endif // PICO_CLOCK_HPP
