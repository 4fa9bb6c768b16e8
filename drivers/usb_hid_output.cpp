/*
 * Usb_Hid_Output Implementation
 */

#include "drivers/usb_hid_output.hpp"
#include "config.h"

#include "pico/time.h"
#include "tusb.h"

#include <cstdio>

bool Usb_Hid_Output::init(uint32_t mount_wait_ms) {
    if (!tusb_init()) {
        printf("[USB] tusb_init failed\n");
        return false;
    }

    absolute_time_t deadline = make_timeout_time_ms(mount_wait_ms);
    while (!tud_mounted() && !time_reached(deadline)) {
        tud_task();
        sleep_ms(1);
    }

    if (tud_mounted()) {
        printf("[USB] HID mounted\n");
    } else {
        /* Not fatal: reports drop until the host enumerates us */
        printf("[USB] not mounted after %lu ms, continuing\n",
               static_cast<unsigned long>(mount_wait_ms));
    }
    return true;
}

void Usb_Hid_Output::press_key(uint8_t keycode) {
    if (!hid_key_press(keyboard_, keycode)) {
        printf("[USB] key 0x%02X dropped, report full\n", keycode);
        return;
    }
    send_keyboard();
}

void Usb_Hid_Output::release_key(uint8_t keycode) {
    hid_key_release(keyboard_, keycode);
    send_keyboard();
}

void Usb_Hid_Output::press_button(OutputButton button) {
    hid_button_press(mouse_, static_cast<uint8_t>(button));
    send_mouse(0, 0, 0);
}

void Usb_Hid_Output::release_button(OutputButton button) {
    hid_button_release(mouse_, static_cast<uint8_t>(button));
    send_mouse(0, 0, 0);
}

void Usb_Hid_Output::move(int8_t dx, int8_t dy, int8_t scroll) {
    send_mouse(dx, dy, scroll);
}

void Usb_Hid_Output::service() {
    tud_task();
}

bool Usb_Hid_Output::wait_ready() {
    if (!tud_mounted()) {
        return false;
    }
    if (tud_suspended()) {
        tud_remote_wakeup();
        return false;
    }

    absolute_time_t deadline = make_timeout_time_us(HID_REPORT_TIMEOUT_US);
    while (!tud_hid_ready()) {
        if (time_reached(deadline)) {
            return false;
        }
        tud_task();
    }
    return true;
}

void Usb_Hid_Output::send_keyboard() {
    bool ok = wait_ready() &&
              tud_hid_keyboard_report(REPORT_ID_KEYBOARD, keyboard_.modifier,
                                      keyboard_.keycodes);
    report_sent(ok);
}

void Usb_Hid_Output::send_mouse(int8_t dx, int8_t dy, int8_t wheel) {
    HidMouseReport r = hid_mouse_report(mouse_, dx, dy, wheel);
    bool ok = wait_ready() &&
              tud_hid_mouse_report(REPORT_ID_MOUSE, r.buttons, r.x, r.y, r.wheel, 0);
    report_sent(ok);
}

void Usb_Hid_Output::report_sent(bool ok) {
    if (ok) {
        if (dropping_) {
            printf("[USB] reports flowing again (%lu dropped total)\n",
                   static_cast<unsigned long>(dropped_reports_));
            dropping_ = false;
        }
        return;
    }

    dropped_reports_++;
    if (!dropping_) {
        printf("[USB] HID report dropped (host not ready)\n");
        dropping_ = true;
    }
}
