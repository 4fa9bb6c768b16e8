/*
 * Bus_Initializer Implementation - Boot-time sensor bus bring-up
 */

#include "logic/bus_initializer.hpp"
#include "logic/bus_recovery.hpp"

#include <cstdio>

Bus_Initializer::Bus_Initializer(Digital_Line_Control &lines, Bus_Factory &factory,
                                 Clock_Source &clock, Status_Interface &status,
                                 const BusInitConfig &config)
    : lines_(lines), factory_(factory), clock_(clock), status_(status),
      config_(config) {}

I2C_Bus *Bus_Initializer::try_acquire() {
    outcome_ = {};
    char buf[64];

    status_.show_status("I2C", "Checking pull-ups...");
    report_pullups();

    status_.show_status("I2C", "Initializing bus...");

    /* 1. Hardware I2C as-is */
    I2C_Bus *bus = factory_.acquire_hardware(config_.hardware_freq_hz);
    if (bus != nullptr) {
        outcome_.kind = BusKind::Hardware;
        outcome_.freq_hz = config_.hardware_freq_hz;
        status_.show_status("I2C", "Using hardware I2C");
        return bus;
    }
    status_.show_error("I2C", "Hardware I2C failed", StatusSeverity::Warning);

    /* 2. Unstick the bus and retry hardware once */
    bus_recovery_release(lines_, clock_, status_, config_.pins);
    outcome_.recovery_run = true;
    status_.show_status("I2C", "Retrying hardware I2C after bus recovery...");

    bus = factory_.acquire_hardware(config_.hardware_freq_hz);
    if (bus != nullptr) {
        outcome_.kind = BusKind::HardwareAfterRecovery;
        outcome_.freq_hz = config_.hardware_freq_hz;
        status_.show_status("I2C", "Using hardware I2C (after recovery)");
        return bus;
    }
    status_.show_error("I2C", "Hardware I2C still failed", StatusSeverity::Warning);

    /* 3. PIO software I2C, slowest last */
    status_.show_status("I2C", "Trying software I2C...");
    for (uint32_t freq_hz : config_.software_freqs_hz) {
        bus = factory_.acquire_software(freq_hz);
        if (bus != nullptr) {
            outcome_.kind = BusKind::Software;
            outcome_.freq_hz = freq_hz;
            snprintf(buf, sizeof(buf), "Using software I2C at %luHz",
                     static_cast<unsigned long>(freq_hz));
            status_.show_status("I2C", buf);
            return bus;
        }
        snprintf(buf, sizeof(buf), "Software I2C at %luHz failed",
                 static_cast<unsigned long>(freq_hz));
        status_.show_error("I2C", buf, StatusSeverity::Warning);
    }

    return nullptr;
}

I2C_Bus &Bus_Initializer::acquire_or_halt() {
    I2C_Bus *bus = try_acquire();
    if (bus == nullptr) {
        halt();
    }
    return *bus;
}

void Bus_Initializer::halt() {
    status_.show_error("I2C", "Could not initialize I2C after all attempts",
                       StatusSeverity::Fatal);
    status_.show_error("I2C", "The Nunchuk may be holding SCL low and not releasing",
                       StatusSeverity::Fatal);
    status_.show_error("I2C", "Power-cycle the board (unplug USB and replug)",
                       StatusSeverity::Fatal);
    status_.show_error("I2C", "Halting", StatusSeverity::Fatal);
    status_.flush();

    while (true) {
        clock_.sleep_ms(BUS_HALT_POLL_MS);
    }
}

bool Bus_Initializer::check_sensor_present(I2C_Bus &bus, uint8_t addr) {
    char buf[96];
    int pos = snprintf(buf, sizeof(buf), "Devices found:");
    bool found = false;

    for (uint8_t a = 0x08; a < 0x78; a++) {
        if (!bus.probe(a)) {
            continue;
        }
        if (a == addr) {
            found = true;
        }
        if (pos > 0 && static_cast<size_t>(pos) < sizeof(buf)) {
            pos += snprintf(buf + pos, sizeof(buf) - static_cast<size_t>(pos),
                            " 0x%02X", static_cast<unsigned>(a));
        }
    }
    status_.show_status("I2C", buf);

    if (!found) {
        snprintf(buf, sizeof(buf), "Nunchuk (0x%02X) not found on I2C bus",
                 static_cast<unsigned>(addr));
        status_.show_error("I2C", buf, StatusSeverity::Warning);
        snprintf(buf, sizeof(buf), "Check wiring: SDA->GP%lu, SCL->GP%lu, 3V3, GND",
                 static_cast<unsigned long>(config_.pins.sda),
                 static_cast<unsigned long>(config_.pins.scl));
        status_.show_error("I2C", buf, StatusSeverity::Warning);
        status_.show_status("I2C", "Continuing in 3 seconds...");
        status_.flush();
        clock_.sleep_ms(NUNCHUK_MISSING_WAIT_MS);
    }

    return found;
}

void Bus_Initializer::report_pullups() {
    PullupReport report = bus_check_pullups(lines_, config_.pins);
    char buf[64];

    snprintf(buf, sizeof(buf), "SDA: external_pullup=%s, with_internal=%s",
             report.sda.external_pullup ? "yes" : "NO",
             report.sda.internal_high ? "high" : "low");
    status_.show_status("I2C", buf);

    snprintf(buf, sizeof(buf), "SCL: external_pullup=%s, with_internal=%s",
             report.scl.external_pullup ? "yes" : "NO",
             report.scl.internal_high ? "high" : "low");
    status_.show_status("I2C", buf);
}
