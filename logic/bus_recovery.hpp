/*
 * I2C Bus Recovery - Line-level procedures over Digital_Line_Control
 * Frees a peer holding SDA low, probes pull-ups, checks idle-high lines
 */

#ifndef BUS_RECOVERY_HPP
#define BUS_RECOVERY_HPP

#include "types.h"
#include "utils/clock_source.hpp"
#include "utils/digital_line_control.hpp"
#include "utils/status_interface.hpp"

#include <cstdint>

/*
 * Clock SCL up to BUS_RECOVERY_MAX_PULSES times (~1ms per level), stopping
 * once SDA reads high, then issue a STOP (SDA low -> SCL high -> SDA high).
 * Both lines are released afterwards and the bus is left to settle for
 * BUS_RECOVERY_SETTLE_MS.
 *
 * Best effort: the caller must re-verify by retrying bus acquisition.
 * Reports the pulse count that freed SDA (or that it never did) via status.
 */
void bus_recovery_release(Digital_Line_Control &lines, Clock_Source &clock,
                          Status_Interface &status, const BusPins &pins);

struct LinePullupReport {
    bool external_pullup;   /* Reads high with no internal pull */
    bool internal_high;     /* Reads high with internal pull-up */
};

struct PullupReport {
    LinePullupReport sda;
    LinePullupReport scl;
};

/*
 * Sample each line floating, then with the internal pull-up, and release it.
 * Informational only; does not gate acquisition.
 */
PullupReport bus_check_pullups(Digital_Line_Control &lines, const BusPins &pins);

/*
 * true if both lines read high as inputs with the given pull.
 * With LinePull::Down this detects external pull-ups and a free bus.
 * Lines are released before returning.
 */
bool bus_lines_idle(Digital_Line_Control &lines, const BusPins &pins, LinePull pull);

#endif // BUS_RECOVERY_HPP
