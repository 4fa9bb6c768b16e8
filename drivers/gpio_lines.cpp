/*
 * Gpio_Lines Implementation - SIO GPIO access for bus diagnostics
 */

#include "drivers/gpio_lines.hpp"

#include "hardware/gpio.h"
#include "pico/time.h"

void Gpio_Lines::configure(uint32_t line, LineDirection dir, LinePull pull) {
    gpio_init(line);
    gpio_set_pulls(line, pull == LinePull::Up, pull == LinePull::Down);
    if (dir == LineDirection::Output) {
        gpio_put(line, false);
        gpio_set_dir(line, GPIO_OUT);
    } else {
        gpio_set_dir(line, GPIO_IN);
        /* Let the pull settle before the first read */
        busy_wait_us_32(10);
    }
}

void Gpio_Lines::set(uint32_t line, bool high) {
    gpio_put(line, high);
}

bool Gpio_Lines::get(uint32_t line) {
    return gpio_get(line);
}

void Gpio_Lines::release(uint32_t line) {
    gpio_set_dir(line, GPIO_IN);
    gpio_disable_pulls(line);
    gpio_deinit(line);
}
