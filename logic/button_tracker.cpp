/*
 * Button Tracker Implementation
 */

#include "logic/button_tracker.hpp"

ButtonEvent button_tracker_update(ButtonTracker &tracker, bool pressed, uint32_t now_ms,
                                  bool stick_moved, uint32_t tap_max_ms) {
    /* New press: start a fresh episode */
    if (pressed && !tracker.is_pressed) {
        tracker.is_pressed = true;
        tracker.press_time_ms = now_ms;
        tracker.moved_during_press = false;
        tracker.was_held = false;
        return ButtonEvent::None;
    }

    /* Unsigned subtraction handles uint32_t wrap */
    uint32_t elapsed = now_ms - tracker.press_time_ms;

    /* Still held */
    if (pressed && tracker.is_pressed) {
        if (stick_moved) {
            tracker.moved_during_press = true;
        }
        if (elapsed > tap_max_ms && !tracker.was_held) {
            tracker.was_held = true;
            return ButtonEvent::HoldStart;
        }
        return ButtonEvent::None;
    }

    /* Released */
    if (!pressed && tracker.is_pressed) {
        tracker.is_pressed = false;
        if (tracker.was_held) {
            return ButtonEvent::HoldEnd;
        }
        if (elapsed <= tap_max_ms && !tracker.moved_during_press) {
            return ButtonEvent::Tap;
        }
        /* Short-of-hold press with stick movement: no event */
        return ButtonEvent::None;
    }

    return ButtonEvent::None;
}
