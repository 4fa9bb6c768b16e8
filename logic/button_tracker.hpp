/*
 * Button Tracker - Tap vs hold state machine
 * Pure logic, no GPIO dependency. Testable on host.
 */

#ifndef BUTTON_TRACKER_HPP
#define BUTTON_TRACKER_HPP

#include "types.h"

#include <cstdint>

struct ButtonTracker {
    bool is_pressed = false;
    uint32_t press_time_ms = 0;      /* Time of last released->pressed transition */
    bool moved_during_press = false; /* Stick left the dead zone during this press */
    bool was_held = false;           /* Press outlasted the tap threshold */
};

/*
 * Advance the tracker by one sample. Call once per tick per button.
 *
 * @param tracker       Persistent tracker (caller-owned)
 * @param pressed       Raw button state this tick (no debounce layer)
 * @param now_ms        Current timestamp in milliseconds
 * @param stick_moved   Stick outside dead zone this tick
 * @param tap_max_ms    Longest press still counted as a tap
 * @return HoldStart once when a press first exceeds tap_max_ms,
 *         HoldEnd on release of a held press,
 *         Tap on release of a short press with no stick movement,
 *         None otherwise
 */
ButtonEvent button_tracker_update(ButtonTracker &tracker, bool pressed, uint32_t now_ms,
                                  bool stick_moved, uint32_t tap_max_ms);

/* Hold phase active: pressed and past the tap threshold */
inline bool button_hold_active(const ButtonTracker &tracker) {
    return tracker.is_pressed && tracker.was_held;
}

#endif // BUTTON_TRACKER_HPP
