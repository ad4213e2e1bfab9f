#include <string.h>
#include <zephyr/sys/util.h>

#include "PadDriver/Protocol/CommandEncoder.hpp"

void CommandEncoder::encode_poll(PadCommand& command, ControllerType type) {
    memset(&command, 0, sizeof(command));
    command.bytes[0] = PAD_ADDR_CONTROLLER;
    command.bytes[1] = PAD_CMD_POLL;
    command.bytes[2] = 0x00;
    command.len = PAD_HEADER_LEN + poll_padding(type);
}

void CommandEncoder::encode_poll(PadCommand& command, ControllerType type, uint8_t small_motor, uint8_t large_motor) {
    encode_poll(command, type);
    command.bytes[PAD_SMALL_MOTOR_POS] = small_motor;
    command.bytes[PAD_LARGE_MOTOR_POS] = large_motor;
    command.len = MAX(command.len, PAD_LARGE_MOTOR_POS + 1);
}

void CommandEncoder::encode_enter_config(PadCommand& command) {
    encode_fixed(command, ENTER_CONFIG, sizeof(ENTER_CONFIG));
}

void CommandEncoder::encode_query_model(PadCommand& command) {
    encode_fixed(command, QUERY_MODEL, sizeof(QUERY_MODEL));
}

void CommandEncoder::encode_enable_analog(PadCommand& command) {
    encode_fixed(command, ENABLE_ANALOG, sizeof(ENABLE_ANALOG));
}

void CommandEncoder::encode_enable_rumble(PadCommand& command) {
    encode_fixed(command, ENABLE_RUMBLE, sizeof(ENABLE_RUMBLE));
}

void CommandEncoder::encode_enable_pressures(PadCommand& command) {
    encode_fixed(command, ENABLE_PRESSURES, sizeof(ENABLE_PRESSURES));
}

void CommandEncoder::encode_exit_config(PadCommand& command) {
    encode_fixed(command, EXIT_CONFIG, sizeof(EXIT_CONFIG));
}

uint8_t CommandEncoder::poll_padding(ControllerType type) {
    switch (type)
    {
        case ControllerType::AnalogRed:
        case ControllerType::DualShock:
        case ControllerType::NegCon:
        case ControllerType::JogCon:
            return 6;
        case ControllerType::DualShock2:
            return 18;
        default:
            break;
    }
    return 0;
}

void CommandEncoder::encode_fixed(PadCommand& command, const uint8_t* bytes, uint8_t len) {
    memset(&command, 0, sizeof(command));
    memcpy(command.bytes, bytes, len);
    command.len = len;
}
