/*
 * Pico_Clock Implementation
 */

#include "drivers/pico_clock.hpp"

#include "pico/time.h"

uint32_t Pico_Clock::now_ms() {
    return to_ms_since_boot(get_absolute_time());
}

uint64_t Pico_Clock::now_us() {
    return to_us_since_boot(get_absolute_time());
}

void Pico_Clock::sleep_ms(uint32_t ms) {
    ::sleep_ms(ms);
}

void Pico_Clock::sleep_us(uint64_t us) {
    ::sleep_us(us);
}
