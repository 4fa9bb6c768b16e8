/*
 * Pico-Nunchuk Firmware - Main Entry Point
 * Brings up the Nunchuk bus, enumerates USB HID, enters the 100Hz loop
 */

#include "config.h"
#include "types.h"

#include "drivers/gpio_lines.hpp"
#include "drivers/nunchuk_wrapper.hpp"
#include "drivers/pico_bus_factory.hpp"
#include "drivers/pico_clock.hpp"
#include "drivers/usb_hid_output.hpp"
#include "logic/bus_initializer.hpp"
#include "logic/control_loop.hpp"
#include "logic/mode_dispatcher.hpp"
#include "utils/stdio_status.hpp"

#include "pico/stdlib.h"

#include <cstdio>

int main() {
    stdio_init_all();

    // USB belongs to HID, so the console is UART. Give a terminal a moment.
    sleep_ms(CONSOLE_WAIT_MS);

    printf("\n========================================\n");
    printf("Pico-Nunchuk CAD Controller\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("I2C:   GP%u/GP%u @ 0x%02X\n", NUNCHUK_SDA_PIN, NUNCHUK_SCL_PIN,
           NUNCHUK_I2C_ADDR);
    printf("========================================\n\n");
    stdio_flush();

    static Gpio_Lines lines;
    static Pico_Clock clock;
    static Stdio_Status status;

    const BusPins pins = {};
    static Pico_Bus_Factory factory(lines, pins);
    Bus_Initializer initializer(lines, factory, clock, status);

    I2C_Bus &bus = initializer.acquire_or_halt();
    initializer.check_sensor_present(bus, NUNCHUK_I2C_ADDR);
    status.flush();

    static Nunchuk_Wrapper nunchuk;
    if (nunchuk.begin(bus)) {
        status.show_status("Nunchuk", "Handshake OK");
    } else {
        /* Non-fatal: the driver retries the handshake from the loop */
        status.show_error("Nunchuk", "Handshake failed - will retry",
                          StatusSeverity::Warning);
    }
    status.flush();

    static Usb_Hid_Output hid;
    if (!hid.init(USB_MOUNT_WAIT_MS)) {
        status.show_error("USB", "Device stack failed to start", StatusSeverity::Error);
    }
    status.flush();

    static const ControllerConfig config = {};
    static Mode_Dispatcher dispatcher(config, hid);
    static Control_Loop loop(nunchuk, dispatcher, hid, clock, status, config);

    loop.run();
}
