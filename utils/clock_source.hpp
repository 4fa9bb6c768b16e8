/*
 * Clock_Source - Monotonic time and blocking delays
 */

#ifndef CLOCK_SOURCE_HPP
#define CLOCK_SOURCE_HPP

#include <cstdint>

class Clock_Source {
public:
    virtual ~Clock_Source() = default;
    virtual uint32_t now_ms() = 0;
    virtual uint64_t now_us() = 0;
    virtual void sleep_ms(uint32_t ms) = 0;
    virtual void sleep_us(uint64_t us) = 0;
};

#endif // CLOCK_SOURCE_HPP
