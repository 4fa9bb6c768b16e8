/*
 * Hardware Configuration for Pico-Nunchuk Firmware
 * Wii Nunchuk -> USB HID mouse/keyboard on RP2350 (Pico 2 W)
 */

#ifndef NUNCHUK_CONFIG_H
#define NUNCHUK_CONFIG_H

/*============================================================================
 * I2C - Wii Nunchuk (hardware I2C0, PIO fallback)
 *============================================================================*/
#define NUNCHUK_I2C_NUM         0U       /* I2C instance 0: GP4/GP5 are I2C0 SDA/SCL */
#define NUNCHUK_SDA_PIN         4U
#define NUNCHUK_SCL_PIN         5U       /* Must be SDA + 1 for PIO I2C fallback */
#define NUNCHUK_I2C_ADDR        0x52U
#define NUNCHUK_I2C_FREQ_HZ     100000U  /* 100kHz Standard Mode */
#define NUNCHUK_PIO_INSTANCE    pio0

/* Software (PIO) fallback frequencies, tried in order */
#define NUNCHUK_SW_FREQ_COUNT   3U
#define NUNCHUK_SW_FREQS_HZ     { 100000U, 50000U, 10000U }

#define NUNCHUK_READ_DELAY_US       2000U    /* Register write -> data ready */
#define NUNCHUK_INIT_DELAY_1_MS     10U
#define NUNCHUK_INIT_DELAY_2_MS     20U
#define NUNCHUK_MISSING_WAIT_MS     3000U    /* Bounded wait when 0x52 absent from scan */

/*============================================================================
 * Bus Recovery Timing
 *============================================================================*/
#define BUS_RECOVERY_MAX_PULSES     9U       /* Worst case: peer mid-byte + ACK */
#define BUS_RECOVERY_HALF_PERIOD_MS 1U
#define BUS_RECOVERY_SETTLE_MS      50U
#define BUS_HALT_POLL_MS            1000U    /* Idle period while halted */

/*============================================================================
 * Joystick Tuning
 *============================================================================*/
#define JOY_CENTER              128
#define JOY_DEADZONE            25       /* Ignore center +/- deadzone */
#define JOY_OUTPUT_LIMIT        127      /* Signed 8-bit HID delta */
#define DRAG_SENSITIVITY        15       /* Pixels/tick at full deflection (A held) */
#define ORBIT_SENSITIVITY       12       /* Pixels/tick at full deflection (B held) */
#define PAN_SENSITIVITY         15       /* Pixels/tick for neutral-mode pan */
#define SCROLL_DIVISOR          40       /* Raw offset / divisor = wheel clicks */

/*============================================================================
 * Button Timing
 *============================================================================*/
#define TAP_MAX_DURATION_MS     300U     /* Longer presses become holds */

/*============================================================================
 * Control Loop
 *============================================================================*/
#define LOOP_TICK_PERIOD_MS     10U      /* 100Hz */
#define LOOP_HEARTBEAT_TICKS    500U     /* ~5s at 100Hz */
#define LOOP_READ_FAIL_RELEASE_TICKS 10U /* Failed reads before inputs are released */

/*============================================================================
 * HID Usages (USB HID Usage Tables, Keyboard page 0x07)
 *============================================================================*/
#define TAP_KEY_A               0x09U    /* 'F' */
#define TAP_KEY_B               0x07U    /* 'D' */
#define PAN_MODIFIER_KEY        0xE1U    /* Left Shift */

/*============================================================================
 * USB Device
 *============================================================================*/
#define USB_VID                 0xCAFEU
#define USB_PID                 0x4052U
#define USB_BCD_DEVICE          0x0100U
#define USB_MOUNT_WAIT_MS       2000U
#define HID_REPORT_TIMEOUT_US   20000U   /* Max wait for a free IN endpoint */
#define HID_POLL_INTERVAL_MS    1U

/*============================================================================
 * Console
 *============================================================================*/
#define CONSOLE_WAIT_MS         1000U    /* Let a UART terminal attach before banner */

#endif /* NUNCHUK_CONFIG_H */
