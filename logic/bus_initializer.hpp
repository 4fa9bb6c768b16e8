/*
 * Bus_Initializer - Boot-time sensor bus bring-up
 * Hardware I2C -> recovery + retry -> PIO software I2C at falling speeds
 * Fail-stop: halts if every strategy fails
 */

#ifndef BUS_INITIALIZER_HPP
#define BUS_INITIALIZER_HPP

#include "config.h"
#include "types.h"

#include "utils/bus_factory.hpp"
#include "utils/clock_source.hpp"
#include "utils/digital_line_control.hpp"
#include "utils/i2c_bus.hpp"
#include "utils/status_interface.hpp"

#include <cstdint>

struct BusInitConfig {
    BusPins pins = {};
    uint32_t hardware_freq_hz = NUNCHUK_I2C_FREQ_HZ;
    uint32_t software_freqs_hz[NUNCHUK_SW_FREQ_COUNT] = NUNCHUK_SW_FREQS_HZ;
};

class Bus_Initializer {
public:
    Bus_Initializer(Digital_Line_Control &lines, Bus_Factory &factory,
                    Clock_Source &clock, Status_Interface &status,
                    const BusInitConfig &config = {});

    /*
     * Run the full escalation once.
     * Returns the acquired bus, or nullptr if every strategy failed.
     */
    I2C_Bus *try_acquire();

    /* try_acquire(), halting forever on failure */
    I2C_Bus &acquire_or_halt();

    /* Report the failure and idle until power-cycle */
    [[noreturn]] void halt();

    /*
     * Scan 0x08-0x77 and report responders. If addr is missing, warn and
     * wait NUNCHUK_MISSING_WAIT_MS so a late sensor can come up; never fatal.
     * Returns true if addr acknowledged.
     */
    bool check_sensor_present(I2C_Bus &bus, uint8_t addr);

    const BusInitOutcome &outcome() const { return outcome_; }

private:
    Digital_Line_Control &lines_;
    Bus_Factory &factory_;
    Clock_Source &clock_;
    Status_Interface &status_;
    const BusInitConfig config_;
    BusInitOutcome outcome_ = {};

    void report_pullups();
};

#endif // BUS_INITIALIZER_HPP
