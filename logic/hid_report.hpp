/*
 * HID Report State - Keyboard/mouse report bookkeeping
 * Pure logic: turns press/release commands into boot-layout report contents
 */

#ifndef HID_REPORT_HPP
#define HID_REPORT_HPP

#include <cstdint>

static constexpr uint8_t HID_KEY_SLOTS = 6;
static constexpr uint8_t HID_MODIFIER_FIRST = 0xE0;   /* Left Control */
static constexpr uint8_t HID_MODIFIER_LAST = 0xE7;    /* Right GUI */

struct HidKeyboardState {
    uint8_t modifier = 0;                 /* Bit n = usage 0xE0 + n */
    uint8_t keycodes[HID_KEY_SLOTS] = {};
};

struct HidMouseState {
    uint8_t buttons = 0;
};

struct HidMouseReport {
    uint8_t buttons;
    int8_t x;
    int8_t y;
    int8_t wheel;
};

/*
 * Add a key to the report. Modifier usages set their modifier bit; other
 * keys take the first free slot. Already-pressed keys are ignored.
 * Returns false if all slots are taken (key dropped).
 */
bool hid_key_press(HidKeyboardState &state, uint8_t keycode);

/* Remove a key. Releasing a key that is not down is a no-op. */
void hid_key_release(HidKeyboardState &state, uint8_t keycode);

void hid_button_press(HidMouseState &state, uint8_t mask);
void hid_button_release(HidMouseState &state, uint8_t mask);

/* Report carrying the current button state and one motion step */
HidMouseReport hid_mouse_report(const HidMouseState &state, int8_t dx, int8_t dy,
                                int8_t wheel);

#endif // HID_REPORT_HPP
