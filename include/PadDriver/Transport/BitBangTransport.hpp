#pragma once

#include <zephyr/kernel.h>

#include "PadDriver/Transport/PadTransport.hpp"
#include "PadDriver/Transport/PadPinBus.hpp"

struct PadTiming {
    uint32_t clock_delay_us; // each clock half-period
    uint32_t byte_delay_us;
    uint32_t att_delay_us;
    uint32_t ack_timeout_us;
};

/** Software (bit-banged) pad bus master.
 *
 * Bytes go out LSB first. The command bit is written while the clock is
 * high, the clock drops, and the data line is sampled after one half-period,
 * before the clock rises again. After every byte except the last one of the
 * transaction the peripheral pulses acknowledge low; a missing pulse aborts
 * the whole transaction.
 */
class BitBangTransport final : public PadTransport {
public:
    BitBangTransport(PadPinBus& bus, const PadTiming& timing) : bus(bus), timing(timing) {}

    int transfer(const PadCommand& command, RawResponse& response) override;

    static PadTiming default_timing();
private:
    uint8_t exchange_byte(uint8_t out);
    int wait_ack();

    PadPinBus& bus;
    PadTiming timing;

    static inline const uint32_t ACK_POLL_STEP_US = 1;
};
