/*
 * I2C Bus Recovery Implementation
 */

#include "logic/bus_recovery.hpp"
#include "config.h"

#include <cstdio>

void bus_recovery_release(Digital_Line_Control &lines, Clock_Source &clock,
                          Status_Interface &status, const BusPins &pins) {
    status.show_status("I2C", "Sending clock pulses to release bus...");

    lines.configure(pins.scl, LineDirection::Output, LinePull::None);
    lines.configure(pins.sda, LineDirection::Input, LinePull::Up);

    bool released = false;
    for (uint32_t i = 0; i < BUS_RECOVERY_MAX_PULSES; i++) {
        lines.set(pins.scl, false);
        clock.sleep_ms(BUS_RECOVERY_HALF_PERIOD_MS);
        lines.set(pins.scl, true);
        clock.sleep_ms(BUS_RECOVERY_HALF_PERIOD_MS);
        if (lines.get(pins.sda)) {
            char buf[48];
            snprintf(buf, sizeof(buf), "Bus released after %lu clock pulses",
                     static_cast<unsigned long>(i + 1U));
            status.show_status("I2C", buf);
            released = true;
            break;
        }
    }
    if (!released) {
        status.show_error("I2C", "SDA still low after clock pulses",
                          StatusSeverity::Warning);
    }

    /* STOP: SDA rises while SCL is high */
    lines.configure(pins.sda, LineDirection::Output, LinePull::None);
    lines.set(pins.sda, false);
    clock.sleep_ms(BUS_RECOVERY_HALF_PERIOD_MS);
    lines.set(pins.scl, true);
    clock.sleep_ms(BUS_RECOVERY_HALF_PERIOD_MS);
    lines.set(pins.sda, true);
    clock.sleep_ms(BUS_RECOVERY_HALF_PERIOD_MS);

    lines.release(pins.scl);
    lines.release(pins.sda);
    clock.sleep_ms(BUS_RECOVERY_SETTLE_MS);
}

static LinePullupReport probe_line(Digital_Line_Control &lines, uint32_t line) {
    LinePullupReport report = {};
    lines.configure(line, LineDirection::Input, LinePull::None);
    report.external_pullup = lines.get(line);
    lines.configure(line, LineDirection::Input, LinePull::Up);
    report.internal_high = lines.get(line);
    lines.release(line);
    return report;
}

PullupReport bus_check_pullups(Digital_Line_Control &lines, const BusPins &pins) {
    PullupReport report = {};
    report.sda = probe_line(lines, pins.sda);
    report.scl = probe_line(lines, pins.scl);
    return report;
}

bool bus_lines_idle(Digital_Line_Control &lines, const BusPins &pins, LinePull pull) {
    lines.configure(pins.sda, LineDirection::Input, pull);
    lines.configure(pins.scl, LineDirection::Input, pull);
    bool idle = lines.get(pins.sda) && lines.get(pins.scl);
    lines.release(pins.sda);
    lines.release(pins.scl);
    return idle;
}
