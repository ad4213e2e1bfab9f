#include <zephyr/logging/log.h>

#include "PadDriver/Transport/BitBangTransport.hpp"

LOG_MODULE_REGISTER(BitBangTransport, LOG_LEVEL_WRN);

PadTiming BitBangTransport::default_timing() {
    return PadTiming{
        .clock_delay_us = CONFIG_PSXPAD_CLOCK_DELAY_US,
        .byte_delay_us = CONFIG_PSXPAD_BYTE_DELAY_US,
        .att_delay_us = CONFIG_PSXPAD_ATT_DELAY_US,
        .ack_timeout_us = CONFIG_PSXPAD_ACK_TIMEOUT_US,
    };
}

int BitBangTransport::transfer(const PadCommand& command, RawResponse& response) {
    int err = 0;
    uint8_t total = PAD_HEADER_LEN;
    unsigned int key = 0;

    response.len = 0;

    if (IS_ENABLED(CONFIG_PSXPAD_ATOMIC_TRANSFER)) {
        key = irq_lock();
    }

    bus.set_command(true);
    bus.set_clock(true);
    bus.set_attention(false);
    bus.delay_us(timing.att_delay_us);

    for (uint8_t i = 0; i < total; i++) {
        const uint8_t out = i < command.len ? command.bytes[i] : 0x00;
        const uint8_t in = exchange_byte(out);
        response.data[response.len++] = in;

        if (i == 1) {
            // type byte tells how many data words follow the header
            total = PAD_HEADER_LEN + pad_data_length(in);
        }

        if (i + 1 < total) {
            err = wait_ack();
            if (err) {
                LOG_DBG("No ack after byte %d (cmd 0x%02x)", i, command.bytes[1]);
                break;
            }
        }
        bus.delay_us(timing.byte_delay_us);
    }

    bus.set_attention(true);

    if (IS_ENABLED(CONFIG_PSXPAD_ATOMIC_TRANSFER)) {
        irq_unlock(key);
    }

    if (err) {
        response.len = 0;
    }
    return err;
}

uint8_t BitBangTransport::exchange_byte(uint8_t out) {
    uint8_t in = 0;
    for (uint8_t bit = 0; bit < 8; bit++) {
        bus.set_command((out & BIT(bit)) != 0);
        bus.set_clock(false);
        bus.delay_us(timing.clock_delay_us);
        if (bus.read_data()) {
            in |= BIT(bit);
        }
        bus.set_clock(true);
        bus.delay_us(timing.clock_delay_us);
    }
    bus.set_command(true);
    return in;
}

int BitBangTransport::wait_ack() {
    if (!bus.has_ack()) {
        return 0;
    }
    for (uint32_t waited = 0; waited < timing.ack_timeout_us; waited += ACK_POLL_STEP_US) {
        if (!bus.read_ack()) {
            return 0;
        }
        bus.delay_us(ACK_POLL_STEP_US);
    }
    return PAD_ERR_NO_ACK;
}
