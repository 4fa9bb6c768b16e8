/*
 * Joystick Axis Math - Pure Algorithms (no SDK dependencies)
 * Deadzone removal, sensitivity scaling, scroll quantisation
 */

#ifndef AXIS_MATH_HPP
#define AXIS_MATH_HPP

#include <cstdint>

/*
 * Map a raw axis sample to a signed pointer delta.
 *
 * offset = value - center. Offsets within +/-deadzone give 0. Outside the
 * band the offset is shrunk toward zero by deadzone, scaled by
 * sensitivity / (center - deadzone) and truncated toward zero.
 * Result is clamped to +/-min(|sensitivity|, JOY_OUTPUT_LIMIT).
 * Returns 0 when center - deadzone <= 0. A negative deadzone counts as 0.
 *
 * Defined for every input; never fails.
 */
int8_t scale_axis(int32_t value, int32_t center, int32_t deadzone, int32_t sensitivity);

/* true if |value - center| > deadzone */
bool axis_outside_deadzone(int32_t value, int32_t center, int32_t deadzone);

/* true if either axis is outside the dead zone */
bool stick_outside_deadzone(int32_t x, int32_t y, int32_t center, int32_t deadzone);

/*
 * Wheel clicks for a vertical stick offset: (value - center) / divisor,
 * truncated toward zero. 0 inside the dead zone or when divisor is 0.
 */
int8_t scroll_delta(int32_t value, int32_t center, int32_t deadzone, int32_t divisor);

#endif // AXIS_MATH_HPP
