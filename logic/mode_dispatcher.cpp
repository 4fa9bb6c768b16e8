/*
 * Mode_Dispatcher Implementation
 */

#include "logic/mode_dispatcher.hpp"
#include "logic/axis_math.hpp"

Mode_Dispatcher::Mode_Dispatcher(const ControllerConfig &config, Output_Sink &output)
    : config_(config), output_(output) {}

TickReport Mode_Dispatcher::tick(const RawSample &sample, uint32_t now_ms) {
    TickReport report = {};

    report.stick_moved = stick_outside_deadzone(sample.axis_x, sample.axis_y,
                                                config_.joy_center, config_.joy_deadzone);

    report.event_a = button_tracker_update(button_a_, sample.button_a, now_ms,
                                           report.stick_moved, config_.tap_max_ms);
    report.event_b = button_tracker_update(button_b_, sample.button_b, now_ms,
                                           report.stick_moved, config_.tap_max_ms);

    if (report.event_a == ButtonEvent::Tap) {
        tap_key(config_.tap_key_a);
    }
    if (report.event_b == ButtonEvent::Tap) {
        tap_key(config_.tap_key_b);
    }

    if (button_hold_active(button_a_)) {
        report.mode = DispatchMode::Drag;
        run_pointer_drag(sample, config_.drag_sensitivity, OutputButton::Left,
                         latch_.left_button_down);
    } else if (button_hold_active(button_b_)) {
        report.mode = DispatchMode::Orbit;
        run_pointer_drag(sample, config_.orbit_sensitivity, OutputButton::Right,
                         latch_.right_button_down);
    } else {
        report.mode = DispatchMode::Neutral;
        if (report.stick_moved) {
            run_neutral(sample);
        }
    }

    /* Release latched buttons only after this tick's motion went out */
    if (report.event_a == ButtonEvent::HoldEnd && latch_.left_button_down) {
        output_.release_button(OutputButton::Left);
        latch_.left_button_down = false;
    }
    if (report.event_b == ButtonEvent::HoldEnd && latch_.right_button_down) {
        output_.release_button(OutputButton::Right);
        latch_.right_button_down = false;
    }

    return report;
}

void Mode_Dispatcher::tap_key(uint8_t keycode) {
    output_.press_key(keycode);
    output_.release_key(keycode);
}

void Mode_Dispatcher::run_pointer_drag(const RawSample &sample, int32_t sensitivity,
                                       OutputButton button, bool &latched) {
    int8_t dx = scale_axis(sample.axis_x, config_.joy_center, config_.joy_deadzone,
                           sensitivity);
    int8_t dy = static_cast<int8_t>(-scale_axis(sample.axis_y, config_.joy_center,
                                                config_.joy_deadzone, sensitivity));

    if (!latched) {
        output_.press_button(button);
        latched = true;
    }

    if (dx != 0 || dy != 0) {
        output_.move(dx, dy, 0);
    }
}

void Mode_Dispatcher::run_neutral(const RawSample &sample) {
    /* Vertical: wheel (zoom) */
    int8_t scroll = scroll_delta(sample.axis_y, config_.joy_center, config_.joy_deadzone,
                                 config_.scroll_divisor);
    if (scroll != 0) {
        output_.move(0, 0, scroll);
    }

    /* Right still latched means orbit's HoldEnd is this tick; the pan's
     * right press/release would fight that latch. A left latch is harmless. */
    if (latch_.right_button_down) {
        return;
    }

    /* Horizontal: one modifier + right-drag step per tick */
    int8_t pan = scale_axis(sample.axis_x, config_.joy_center, config_.joy_deadzone,
                            config_.pan_sensitivity);
    if (pan != 0) {
        output_.press_key(config_.pan_modifier_key);
        output_.press_button(OutputButton::Right);
        output_.move(pan, 0, 0);
        output_.release_button(OutputButton::Right);
        output_.release_key(config_.pan_modifier_key);
    }
}
