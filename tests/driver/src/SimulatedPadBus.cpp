#include <string.h>
#include <zephyr/sys/util.h>

#include "SimulatedPadBus.hpp"

SimulatedPadBus::SimulatedPadBus() {
    memset(response, 0xFF, sizeof(response));
    memset(received, 0, sizeof(received));
}

void SimulatedPadBus::load(const uint8_t* bytes, uint8_t len) {
    memset(response, 0xFF, sizeof(response));
    memcpy(response, bytes, len);
    response_len = len;
}

void SimulatedPadBus::set_attention(bool level) {
    if (attention && !level) {
        received_count = 0;
        shift = 0;
        bit = 0;
        ack_pending = false;
        selections++;
    }
    attention = level;
}

void SimulatedPadBus::set_clock(bool level) {
    const bool rising = !clock && level;
    clock = level;
    if (attention || !rising || received_count >= PAD_MAX_PACKET_LEN) {
        return;
    }

    if (command) {
        shift |= BIT(bit);
    }
    if (++bit < 8) {
        return;
    }

    received[received_count++] = shift;
    shift = 0;
    bit = 0;
    ack_pending = received_count < response_len && received_count <= ack_limit;
}

bool SimulatedPadBus::read_data() {
    if (attention || received_count >= response_len) {
        return true;
    }
    return (response[received_count] & BIT(bit)) != 0;
}

bool SimulatedPadBus::read_ack() {
    if (ack_pending) {
        ack_pending = false;
        return false;
    }
    return true;
}
