/*
 * Digital_Line_Control - Raw pin-level access for bus diagnostics and recovery
 * Lines are GPIO numbers on target; fakes model them in host tests
 */

#ifndef DIGITAL_LINE_CONTROL_HPP
#define DIGITAL_LINE_CONTROL_HPP

#include <cstdint>

enum class LineDirection : uint8_t { Input, Output };

/* Down is only used by the idle-line check before hardware bus acquisition */
enum class LinePull : uint8_t { None, Up, Down };

class Digital_Line_Control {
public:
    virtual ~Digital_Line_Control() = default;
    virtual void configure(uint32_t line, LineDirection dir, LinePull pull) = 0;
    virtual void set(uint32_t line, bool high) = 0;
    virtual bool get(uint32_t line) = 0;

    /* Return the line to an unconfigured, high-impedance state */
    virtual void release(uint32_t line) = 0;
};

#endif // DIGITAL_LINE_CONTROL_HPP
