/*
 * HID Report State Implementation
 */

#include "logic/hid_report.hpp"

static bool is_modifier(uint8_t keycode) {
    return keycode >= HID_MODIFIER_FIRST && keycode <= HID_MODIFIER_LAST;
}

bool hid_key_press(HidKeyboardState &state, uint8_t keycode) {
    if (is_modifier(keycode)) {
        state.modifier |= static_cast<uint8_t>(1U << (keycode - HID_MODIFIER_FIRST));
        return true;
    }
    if (keycode == 0U) {
        return false;
    }

    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (state.keycodes[i] == keycode) {
            return true;
        }
    }
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (state.keycodes[i] == 0U) {
            state.keycodes[i] = keycode;
            return true;
        }
    }
    return false;
}

void hid_key_release(HidKeyboardState &state, uint8_t keycode) {
    if (is_modifier(keycode)) {
        state.modifier &= static_cast<uint8_t>(~(1U << (keycode - HID_MODIFIER_FIRST)));
        return;
    }
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (state.keycodes[i] == keycode) {
            state.keycodes[i] = 0U;
        }
    }
}

void hid_button_press(HidMouseState &state, uint8_t mask) {
    state.buttons |= mask;
}

void hid_button_release(HidMouseState &state, uint8_t mask) {
    state.buttons &= static_cast<uint8_t>(~mask);
}

HidMouseReport hid_mouse_report(const HidMouseState &state, int8_t dx, int8_t dy,
                                int8_t wheel) {
    return HidMouseReport{state.buttons, dx, dy, wheel};
}
