/*
 * Control_Loop Implementation
 */

#include "logic/control_loop.hpp"
#include "logic/nunchuk_math.hpp"

#include <cstdio>

Control_Loop::Control_Loop(Sensor_Source &sensor, Mode_Dispatcher &dispatcher,
                           Output_Sink &output, Clock_Source &clock,
                           Status_Interface &status, const ControllerConfig &config)
    : sensor_(sensor), dispatcher_(dispatcher), output_(output), clock_(clock),
      status_(status), config_(config),
      last_sample_(nunchuk_neutral_sample(config.joy_center)) {}

TickReport Control_Loop::run_one_tick() {
    uint64_t start_us = clock_.now_us();
    uint32_t now_ms = clock_.now_ms();

    RawSample sample = read_sample();
    TickReport report = dispatcher_.tick(sample, now_ms);
    output_.service();

    stats_.tick_count++;
    if (config_.heartbeat_ticks != 0U && stats_.tick_count % config_.heartbeat_ticks == 0U) {
        heartbeat();
    }

    uint64_t elapsed_us = clock_.now_us() - start_us;
    update_jitter(elapsed_us > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(elapsed_us));

    /* Overrun ticks get no sleep; the next tick starts immediately */
    uint64_t period_us = static_cast<uint64_t>(config_.tick_period_ms) * 1000U;
    if (elapsed_us < period_us) {
        clock_.sleep_us(period_us - elapsed_us);
    }

    return report;
}

void Control_Loop::run() {
    status_.show_status("Loop", "Ready - move joystick or press buttons");
    status_.flush();
    while (true) {
        run_one_tick();
    }
}

RawSample Control_Loop::read_sample() {
    RawSample sample = {};
    if (sensor_.read(sample)) {
        if (stats_.read_fail_streak != 0U) {
            char buf[48];
            snprintf(buf, sizeof(buf), "Sensor back after %lu failed reads",
                     static_cast<unsigned long>(stats_.read_fail_streak));
            status_.show_status("Loop", buf);
            stats_.read_fail_streak = 0;
        }
        last_sample_ = sample;
        return sample;
    }

    if (stats_.read_fail_streak == 0U) {
        status_.show_error("Loop", "Sensor read failed - holding last sample",
                           StatusSeverity::Warning);
    }
    if (stats_.read_fail_streak < UINT32_MAX) { stats_.read_fail_streak++; }
    if (stats_.read_failures < UINT32_MAX) { stats_.read_failures++; }

    /* Sensor gone rather than glitching: stop driving outputs from stale input */
    if (stats_.read_fail_streak >= config_.read_fail_release_ticks) {
        uint32_t release_at = config_.read_fail_release_ticks == 0U
                                  ? 1U : config_.read_fail_release_ticks;
        if (stats_.read_fail_streak == release_at) {
            status_.show_error("Loop", "Sensor lost - releasing inputs",
                               StatusSeverity::Warning);
        }
        last_sample_ = nunchuk_neutral_sample(config_.joy_center);
    }
    return last_sample_;
}

void Control_Loop::update_jitter(uint32_t elapsed_us) {
    if (elapsed_us < stats_.jitter.min_us) {
        stats_.jitter.min_us = elapsed_us;
    }
    if (elapsed_us > stats_.jitter.max_us) {
        stats_.jitter.max_us = elapsed_us;
    }
    stats_.jitter.last_us = elapsed_us;
}

void Control_Loop::heartbeat() {
    const OutputLatch &latch = dispatcher_.latch();
    char buf[128];
    snprintf(buf, sizeof(buf),
             "ticks=%lu  jitter=%lu/%lu/%lu us  read_fail=%lu  latch=%c%c",
             static_cast<unsigned long>(stats_.tick_count),
             static_cast<unsigned long>(stats_.jitter.min_us == UINT32_MAX ? 0U
                                                                           : stats_.jitter.min_us),
             static_cast<unsigned long>(stats_.jitter.last_us),
             static_cast<unsigned long>(stats_.jitter.max_us),
             static_cast<unsigned long>(stats_.read_failures),
             latch.left_button_down ? 'L' : '-',
             latch.right_button_down ? 'R' : '-');
    status_.show_status("heartbeat", buf);
}
