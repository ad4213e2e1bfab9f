#pragma once

#include <errno.h>
#include <zephyr/types.h>

#include "PadState.hpp"

// Error codes, all negative errno values like the rest of the driver API
static constexpr int PAD_ERR_NO_ACK = -ETIMEDOUT;
static constexpr int PAD_ERR_PROTOCOL = -EPROTO;
static constexpr int PAD_ERR_UNKNOWN_TYPE = -ENOTSUP;
static constexpr int PAD_ERR_NEGOTIATION = -ECONNREFUSED;

static constexpr uint8_t PAD_ADDR_CONTROLLER = 0x01;

static constexpr uint8_t PAD_CMD_POLL = 0x42;
static constexpr uint8_t PAD_CMD_CONFIG = 0x43;
static constexpr uint8_t PAD_CMD_SET_ANALOG = 0x44;
static constexpr uint8_t PAD_CMD_QUERY_MODEL = 0x45;
static constexpr uint8_t PAD_CMD_MAP_MOTORS = 0x4D;
static constexpr uint8_t PAD_CMD_SET_RESPONSE = 0x4F;

static constexpr uint8_t PAD_IDLE_BYTE = 0xFF;
static constexpr uint8_t PAD_READY_MARKER = 0x5A;

// address/idle, type+length, ready marker
static constexpr uint8_t PAD_HEADER_LEN = 3;
static constexpr uint8_t PAD_MAX_DATA_LEN = 0x0F * 2;
static constexpr uint8_t PAD_MAX_PACKET_LEN = PAD_HEADER_LEN + PAD_MAX_DATA_LEN;

// Position of the motor bytes inside a poll packet
static constexpr uint8_t PAD_SMALL_MOTOR_POS = 3;
static constexpr uint8_t PAD_LARGE_MOTOR_POS = 4;

static constexpr uint8_t PAD_STICK_BYTES = 4;

// Model byte in the reply to the model query
static constexpr uint8_t PAD_MODEL_POS = 3;

static inline uint8_t pad_data_length(uint8_t type_byte) {
    return (type_byte & 0x0F) * 2;
}

struct PadCommand {
    uint8_t bytes[PAD_MAX_PACKET_LEN];
    uint8_t len;
};

struct RawResponse {
    uint8_t data[PAD_MAX_PACKET_LEN];
    uint8_t len;
};

struct DecodedResponse {
    ControllerType type;
    uint8_t type_byte;

    bool has_buttons;
    uint16_t buttons; // pressed = 1

    uint8_t stick_count; // 0, 2 or 4 bytes present
    uint8_t sticks[PAD_STICK_BYTES]; // right x, right y, left x, left y

    uint8_t pressure_count;
    uint8_t pressures[PAD_PRESSURE_COUNT];
};
