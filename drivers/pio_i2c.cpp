/*
 * PIO_I2C Implementation - PIO-based I2C master driver
 * Based on Raspberry Pi pico-examples pio/i2c (BSD-3-Clause)
 */

#include "drivers/pio_i2c.hpp"

#include "pio_i2c.pio.h"

#include "hardware/clocks.h"
#include "hardware/gpio.h"
#include "pico/time.h"

bool PIO_I2C::init(PIO pio, uint sda_pin, uint scl_pin, uint freq_hz) {
    if (scl_pin != sda_pin + 1U) {
        return false;
    }
    pio_ = pio;

    if (!pio_can_add_program(pio_, &i2c_program)) {
        pio_ = nullptr;
        return false;
    }
    offset_ = pio_add_program(pio_, &i2c_program);

    int claimed = pio_claim_unused_sm(pio_, false);
    if (claimed < 0) {
        pio_remove_program(pio_, &i2c_program, offset_);
        pio_ = nullptr;
        return false;
    }
    sm_ = static_cast<uint>(claimed);
    sda_pin_ = sda_pin;
    scl_pin_ = scl_pin;

    // i2c_program_init sets clock divider for 100kHz; 32 PIO cycles per SCL period
    i2c_program_init(pio_, sm_, offset_, sda_pin, scl_pin);

    if (freq_hz != 100000U) {
        float div = static_cast<float>(clock_get_hz(clk_sys)) /
                    (32.0f * static_cast<float>(freq_hz));
        pio_sm_set_clkdiv(pio_, sm_, div);
    }

    return true;
}

void PIO_I2C::deinit() {
    if (pio_ == nullptr) {
        return;
    }
    pio_sm_set_enabled(pio_, sm_, false);
    pio_sm_unclaim(pio_, sm_);
    pio_remove_program(pio_, &i2c_program, offset_);
    pio_ = nullptr;

    gpio_set_oeover(sda_pin_, GPIO_OVERRIDE_NORMAL);
    gpio_set_oeover(scl_pin_, GPIO_OVERRIDE_NORMAL);
    gpio_deinit(sda_pin_);
    gpio_deinit(scl_pin_);
}

void PIO_I2C::put16(uint16_t data) {
    if (error_) { return; }

    absolute_time_t deadline = make_timeout_time_us(TIMEOUT_US);
    while (pio_sm_is_tx_fifo_full(pio_, sm_)) {
        if (absolute_time_diff_us(get_absolute_time(), deadline) <= 0) {
            error_ = true;
            return;
        }
        tight_loop_contents();
    }
    // 16-bit write to the TX FIFO; the SM autopulls 16 bits per record
    volatile uint16_t *txf_halfword =
        reinterpret_cast<volatile uint16_t *>(
            reinterpret_cast<uintptr_t>(&pio_->txf[sm_]));
    *txf_halfword = data;
}

uint8_t PIO_I2C::get8() {
    if (error_) { return 0; }

    absolute_time_t deadline = make_timeout_time_us(TIMEOUT_US);
    while (pio_sm_is_rx_fifo_empty(pio_, sm_)) {
        if (absolute_time_diff_us(get_absolute_time(), deadline) <= 0) {
            error_ = true;
            return 0;
        }
        tight_loop_contents();
    }
    return static_cast<uint8_t>(pio_->rxf[sm_]);
}

bool PIO_I2C::check_error() {
    return pio_interrupt_get(pio_, sm_);
}

void PIO_I2C::clear_error() {
    pio_interrupt_clear(pio_, sm_);
    // Drain FIFOs and jump SM back to entry point
    pio_sm_drain_tx_fifo(pio_, sm_);
    pio_sm_exec(pio_, sm_, pio_encode_jmp(offset_ + i2c_offset_entry_point));
}

void PIO_I2C::rx_enable(bool en) {
    if (en) {
        hw_set_bits(&pio_->sm[sm_].shiftctrl, PIO_SM0_SHIFTCTRL_AUTOPUSH_BITS);
    } else {
        hw_clear_bits(&pio_->sm[sm_].shiftctrl, PIO_SM0_SHIFTCTRL_AUTOPUSH_BITS);
    }
}

void PIO_I2C::start() {
    put16(1u << ICOUNT_LSB);  // Instruction count = 1 (execute 2 instructions)
    put16(set_scl_sda_program_instructions[I2C_SC1_SD1]);
    put16(set_scl_sda_program_instructions[I2C_SC1_SD0]);  // START: SDA falls while SCL high
}

void PIO_I2C::stop() {
    put16(2u << ICOUNT_LSB);  // Execute 3 instructions
    put16(set_scl_sda_program_instructions[I2C_SC0_SD0]);
    put16(set_scl_sda_program_instructions[I2C_SC1_SD0]);
    put16(set_scl_sda_program_instructions[I2C_SC1_SD1]);  // STOP: SDA rises while SCL high
}

/* Finished when the SM stalls on an empty TX FIFO or raises its error IRQ */
void PIO_I2C::wait_idle() {
    pio_->fdebug = 1u << (PIO_FDEBUG_TXSTALL_LSB + sm_);
    absolute_time_t deadline = make_timeout_time_us(TIMEOUT_US);
    while (!(pio_->fdebug & (1u << (PIO_FDEBUG_TXSTALL_LSB + sm_))) && !check_error()) {
        if (absolute_time_diff_us(get_absolute_time(), deadline) <= 0) {
            error_ = true;
            return;
        }
        tight_loop_contents();
    }
}

/* NAK or FIFO timeout: put the SM back at its entry point, release the bus */
bool PIO_I2C::abort_transfer() {
    clear_error();
    error_ = false;
    stop();
    wait_idle();
    error_ = false;
    return false;
}

bool PIO_I2C::write_blocking(uint8_t addr, const uint8_t *data, uint32_t len) {
    if (pio_ == nullptr) {
        return false;
    }
    error_ = false;
    start();
    rx_enable(false);

    // Address byte: addr << 1 | 0 (write); bit 0 releases SDA for the peer's ACK
    put16(static_cast<uint16_t>((static_cast<uint16_t>(addr) << 2) | 1u));

    // Data bytes: NAK on the final byte is tolerated
    for (uint32_t i = 0; i < len; i++) {
        if (error_ || check_error()) {
            return abort_transfer();
        }
        bool last = (i == len - 1);
        put16(static_cast<uint16_t>((static_cast<uint16_t>(data[i]) << DATA_LSB) |
                                    (last ? (1u << FINAL_LSB) : 0u) |
                                    (1u << NAK_LSB)));
    }

    stop();
    wait_idle();

    if (error_ || check_error()) {
        return abort_transfer();
    }
    return true;
}

bool PIO_I2C::read_blocking(uint8_t addr, uint8_t *data, uint32_t len) {
    if (pio_ == nullptr || len == 0) {
        return false;
    }
    error_ = false;
    start();
    rx_enable(true);

    // Discard anything left from a previous transfer
    while (!pio_sm_is_rx_fifo_empty(pio_, sm_)) {
        (void)pio_->rxf[sm_];
    }

    // Address byte: addr << 1 | 1 (read); the SM also pushes it to RX
    put16(static_cast<uint16_t>((static_cast<uint16_t>(addr) << 2) | 3u));
    (void)get8();

    for (uint32_t i = 0; i < len; i++) {
        if (error_ || check_error()) {
            return abort_transfer();
        }
        bool last = (i == len - 1);
        // Release SDA (0xFF) so the peer drives data; ACK all but the final byte
        put16(static_cast<uint16_t>((0xFFu << DATA_LSB) |
                                    (last ? ((1u << FINAL_LSB) | (1u << NAK_LSB)) : 0u)));
        data[i] = get8();
        if (error_) {
            return abort_transfer();
        }
    }

    stop();
    wait_idle();
    rx_enable(false);

    if (error_ || check_error()) {
        return abort_transfer();
    }
    return true;
}
