/*
 * Output_Sink - Discrete pointer/keyboard commands for the host
 * Commands are fire-and-forget; there is no acknowledgement path
 */

#ifndef OUTPUT_SINK_HPP
#define OUTPUT_SINK_HPP

#include <cstdint>

/* Bit values match the HID boot mouse button byte */
enum class OutputButton : uint8_t { Left = 0x01, Right = 0x02, Middle = 0x04 };

class Output_Sink {
public:
    virtual ~Output_Sink() = default;
    virtual void press_key(uint8_t keycode) = 0;
    virtual void release_key(uint8_t keycode) = 0;
    virtual void press_button(OutputButton button) = 0;
    virtual void release_button(OutputButton button) = 0;
    virtual void move(int8_t dx, int8_t dy, int8_t scroll) = 0;

    /* Give the transport a chance to run between ticks */
    virtual void service() = 0;
};

#endif // OUTPUT_SINK_HPP
