/*
 * Usb_Hid_Output - Output_Sink over TinyUSB composite HID
 * Keyboard on report ID 1, mouse on report ID 2
 */

#ifndef USB_HID_OUTPUT_HPP
#define USB_HID_OUTPUT_HPP

#include "logic/hid_report.hpp"
#include "utils/output_sink.hpp"

#include <cstdint>

enum {
    REPORT_ID_KEYBOARD = 1,
    REPORT_ID_MOUSE,
};

class Usb_Hid_Output final : public Output_Sink {
public:
    /* Start the device stack and give the host a bounded time to enumerate */
    bool init(uint32_t mount_wait_ms);

    void press_key(uint8_t keycode) override;
    void release_key(uint8_t keycode) override;
    void press_button(OutputButton button) override;
    void release_button(OutputButton button) override;
    void move(int8_t dx, int8_t dy, int8_t scroll) override;
    void service() override;

    uint32_t dropped_reports() const { return dropped_reports_; }

private:
    HidKeyboardState keyboard_;
    HidMouseState mouse_;
    uint32_t dropped_reports_ = 0;
    bool dropping_ = false;

    bool wait_ready();
    void send_keyboard();
    void send_mouse(int8_t dx, int8_t dy, int8_t wheel);
    void report_sent(bool ok);
};

#endif // USB_HID_OUTPUT_HPP
