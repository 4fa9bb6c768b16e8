/*
 * Joystick Axis Math Implementation
 * Integer arithmetic only: exact truncation, no FPU rounding at boundaries
 */

#include "logic/axis_math.hpp"
#include "config.h"

static int64_t abs64(int64_t v) {
    return (v < 0) ? -v : v;
}

static int64_t clamp64(int64_t v, int64_t limit) {
    if (v > limit) { return limit; }
    if (v < -limit) { return -limit; }
    return v;
}

int8_t scale_axis(int32_t value, int32_t center, int32_t deadzone, int32_t sensitivity) {
    int64_t zone = (deadzone < 0) ? 0 : deadzone;
    int64_t offset = static_cast<int64_t>(value) - center;
    if (abs64(offset) <= zone) {
        return 0;
    }

    int64_t max_range = static_cast<int64_t>(center) - zone;
    if (max_range <= 0) {
        return 0;
    }

    /* Start the ramp at the dead-zone edge, not at center */
    if (offset > 0) {
        offset -= zone;
    } else {
        offset += zone;
    }

    /* Past full range the result clamps anyway; bounding here keeps the product in int64 */
    offset = clamp64(offset, max_range);

    /* C++ division truncates toward zero */
    int64_t scaled = (offset * sensitivity) / max_range;

    int64_t limit = abs64(sensitivity);
    if (limit > JOY_OUTPUT_LIMIT) {
        limit = JOY_OUTPUT_LIMIT;
    }
    return static_cast<int8_t>(clamp64(scaled, limit));
}

bool axis_outside_deadzone(int32_t value, int32_t center, int32_t deadzone) {
    return abs64(static_cast<int64_t>(value) - center) > deadzone;
}

bool stick_outside_deadzone(int32_t x, int32_t y, int32_t center, int32_t deadzone) {
    return axis_outside_deadzone(x, center, deadzone) ||
           axis_outside_deadzone(y, center, deadzone);
}

int8_t scroll_delta(int32_t value, int32_t center, int32_t deadzone, int32_t divisor) {
    if (divisor == 0 || !axis_outside_deadzone(value, center, deadzone)) {
        return 0;
    }
    int64_t clicks = (static_cast<int64_t>(value) - center) / divisor;
    return static_cast<int8_t>(clamp64(clicks, JOY_OUTPUT_LIMIT));
}
