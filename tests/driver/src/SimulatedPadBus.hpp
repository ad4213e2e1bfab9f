#pragma once

#include "PadDriver/Transport/PadPinBus.hpp"
#include "PadDriver/PadTypes.hpp"

/** Controller side of the pad bus, simulated at pin level.
 *
 * The command line is latched on the rising clock edge, the data line
 * follows the loaded response bit by bit. Acknowledge is pulsed after each
 * byte except the last loaded one, up to the configured number of bytes.
 * Past the end of the response the data line floats high.
 */
class SimulatedPadBus final : public PadPinBus {
public:
    SimulatedPadBus();

    void load(const uint8_t* bytes, uint8_t len);
    void set_ack_limit(uint8_t bytes) { ack_limit = bytes; }
    void set_ack_wired(bool wired) { ack_wired = wired; }

    void set_clock(bool level) override;
    void set_command(bool level) override { command = level; }
    void set_attention(bool level) override;
    bool read_data() override;

    bool has_ack() const override { return ack_wired; }
    bool read_ack() override;

    void delay_us(uint32_t us) override { total_delay_us += us; }

    uint8_t get_received_count() const { return received_count; }
    const uint8_t* get_received() const { return received; }
    bool get_attention() const { return attention; }
    uint8_t get_selections() const { return selections; }
    uint32_t get_total_delay_us() const { return total_delay_us; }
private:
    uint8_t response[PAD_MAX_PACKET_LEN];
    uint8_t response_len{ 0 };

    uint8_t received[PAD_MAX_PACKET_LEN];
    uint8_t received_count{ 0 };
    uint8_t shift{ 0 };
    uint8_t bit{ 0 };

    bool clock{ true };
    bool command{ true };
    bool attention{ true };
    bool ack_pending{ false };
    bool ack_wired{ true };
    uint8_t ack_limit{ PAD_MAX_PACKET_LEN };

    uint8_t selections{ 0 };
    uint32_t total_delay_us{ 0 };
};
