/*
 * Control_Loop - 100Hz cooperative main loop
 * Sensor read -> Mode_Dispatcher -> output service -> sleep to tick boundary
 */

#ifndef CONTROL_LOOP_HPP
#define CONTROL_LOOP_HPP

#include "types.h"
#include "logic/mode_dispatcher.hpp"
#include "utils/clock_source.hpp"
#include "utils/output_sink.hpp"
#include "utils/sensor_source.hpp"
#include "utils/status_interface.hpp"

#include <cstdint>

struct JitterStats {
    uint32_t min_us = UINT32_MAX;
    uint32_t max_us = 0;
    uint32_t last_us = 0;
};

struct LoopStats {
    uint32_t tick_count = 0;
    uint32_t read_failures = 0;      /* Total failed sensor reads */
    uint32_t read_fail_streak = 0;   /* Consecutive failed reads */
    JitterStats jitter = {};
};

class Control_Loop {
public:
    Control_Loop(Sensor_Source &sensor, Mode_Dispatcher &dispatcher, Output_Sink &output,
                 Clock_Source &clock, Status_Interface &status,
                 const ControllerConfig &config);

    /*
     * One full tick including the end-of-tick sleep.
     * A failed read is not retried: the tick reuses the last good sample.
     * After read_fail_release_ticks consecutive failures the sample goes
     * neutral, so holds end and latched buttons are released.
     */
    TickReport run_one_tick();

    [[noreturn]] void run();

    const LoopStats &stats() const { return stats_; }

private:
    Sensor_Source &sensor_;
    Mode_Dispatcher &dispatcher_;
    Output_Sink &output_;
    Clock_Source &clock_;
    Status_Interface &status_;
    const ControllerConfig config_;
    LoopStats stats_ = {};
    RawSample last_sample_;

    RawSample read_sample();
    void update_jitter(uint32_t elapsed_us);
    void heartbeat();
};

#endif // CONTROL_LOOP_HPP
