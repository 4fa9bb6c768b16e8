/*
 * Mode_Dispatcher - Per-tick input -> HID command mapping
 * Tap keys, then exactly one of Drag / Orbit / Neutral, then unlatch
 */

#ifndef MODE_DISPATCHER_HPP
#define MODE_DISPATCHER_HPP

#include "types.h"
#include "logic/button_tracker.hpp"
#include "utils/output_sink.hpp"

#include <cstdint>

/*============================================================================
 * Tick Report
 *============================================================================
 * What the dispatcher decided for one sample. Informational; all output
 * has already been issued to the sink by the time it is returned.
 */
struct TickReport {
    ButtonEvent event_a = ButtonEvent::None;
    ButtonEvent event_b = ButtonEvent::None;
    DispatchMode mode = DispatchMode::Neutral;
    bool stick_moved = false;
};

/*============================================================================
 * Mode Dispatcher
 *============================================================================
 * Modes, in priority order:
 *   DRAG    (A hold):          left button latched, stick moves pointer
 *   ORBIT   (B hold, A not):   right button latched, stick moves pointer
 *   NEUTRAL (no hold):         Y -> scroll wheel, X -> modifier+right-drag pan
 *
 * Y is inverted in Drag/Orbit (stick up = pointer up).
 * A latched button is released on the HoldEnd tick of its own button only.
 */
class Mode_Dispatcher {
public:
    Mode_Dispatcher(const ControllerConfig &config, Output_Sink &output);

    TickReport tick(const RawSample &sample, uint32_t now_ms);

    const ButtonTracker &button_a() const { return button_a_; }
    const ButtonTracker &button_b() const { return button_b_; }
    const OutputLatch &latch() const { return latch_; }

private:
    const ControllerConfig config_;
    Output_Sink &output_;
    ButtonTracker button_a_ = {};
    ButtonTracker button_b_ = {};
    OutputLatch latch_ = {};

    void tap_key(uint8_t keycode);
    void run_pointer_drag(const RawSample &sample, int32_t sensitivity,
                          OutputButton button, bool &latched);
    void run_neutral(const RawSample &sample);
};

#endif // MODE_DISPATCHER_HPP
