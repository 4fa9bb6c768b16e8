/*
 * Core Type Definitions for Pico-Nunchuk Firmware
 */

#ifndef NUNCHUK_TYPES_H
#define NUNCHUK_TYPES_H

#include "config.h"

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Sensor Sample
 *============================================================================
 * One Nunchuk snapshot per tick. Not retained beyond the tick that read it.
 * Axis range 0..255, rest position near JOY_CENTER.
 */
typedef struct {
    uint8_t axis_x;
    uint8_t axis_y;
    bool button_a;      /* Nunchuk C */
    bool button_b;      /* Nunchuk Z */
} raw_sample_t;

#ifdef __cplusplus
static_assert(sizeof(raw_sample_t) == 4U, "raw_sample_t must stay 4 bytes");
#else
_Static_assert(sizeof(raw_sample_t) == 4U, "raw_sample_t must stay 4 bytes");
#endif

/*============================================================================
 * Controller Types (C++ only)
 *============================================================================*/
#ifdef __cplusplus

using RawSample = raw_sample_t;

enum class ButtonEvent : uint8_t { None, Tap, HoldStart, HoldEnd };

enum class DispatchMode : uint8_t { Neutral, Drag, Orbit };

/*
 * Tuning parameters for the input pipeline.
 * Built once at startup and handed to each component; never mutated after.
 */
struct ControllerConfig {
    int32_t joy_center = JOY_CENTER;
    int32_t joy_deadzone = JOY_DEADZONE;
    int32_t drag_sensitivity = DRAG_SENSITIVITY;
    int32_t orbit_sensitivity = ORBIT_SENSITIVITY;
    int32_t pan_sensitivity = PAN_SENSITIVITY;
    int32_t scroll_divisor = SCROLL_DIVISOR;
    uint32_t tap_max_ms = TAP_MAX_DURATION_MS;
    uint32_t tick_period_ms = LOOP_TICK_PERIOD_MS;
    uint32_t heartbeat_ticks = LOOP_HEARTBEAT_TICKS;
    uint32_t read_fail_release_ticks = LOOP_READ_FAIL_RELEASE_TICKS;
    uint8_t tap_key_a = TAP_KEY_A;
    uint8_t tap_key_b = TAP_KEY_B;
    uint8_t pan_modifier_key = PAN_MODIFIER_KEY;
};

/* Whether the loop has an unmatched press outstanding on each pointer button */
struct OutputLatch {
    bool left_button_down = false;
    bool right_button_down = false;
};

/*============================================================================
 * Bus Types
 *============================================================================*/

struct BusPins {
    uint32_t sda = NUNCHUK_SDA_PIN;
    uint32_t scl = NUNCHUK_SCL_PIN;
};

enum class BusKind : uint8_t { None, Hardware, HardwareAfterRecovery, Software };

struct BusInitOutcome {
    BusKind kind = BusKind::None;
    uint32_t freq_hz = 0;
    bool recovery_run = false;
};

#endif /* __cplusplus */

#endif /* NUNCHUK_TYPES_H */
