/*
 * Gpio_Lines - Digital_Line_Control over RP2350 SIO GPIO
 */

#ifndef GPIO_LINES_HPP
#define GPIO_LINES_HPP

#include "utils/digital_line_control.hpp"

class Gpio_Lines final : public Digital_Line_Control {
public:
    void configure(uint32_t line, LineDirection dir, LinePull pull) override;
    void set(uint32_t line, bool high) override;
    bool get(uint32_t line) override;
    void release(uint32_t line) override;
};

#endif // GPIO_LINES_HPP
