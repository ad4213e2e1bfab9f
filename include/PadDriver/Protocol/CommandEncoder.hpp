#pragma once

#include "PadDriver/PadTypes.hpp"

class CommandEncoder final {
public:
    static void encode_poll(PadCommand& command, ControllerType type);
    static void encode_poll(PadCommand& command, ControllerType type, uint8_t small_motor, uint8_t large_motor);

    static void encode_enter_config(PadCommand& command);
    static void encode_query_model(PadCommand& command);
    static void encode_enable_analog(PadCommand& command);
    static void encode_enable_rumble(PadCommand& command);
    static void encode_enable_pressures(PadCommand& command);
    static void encode_exit_config(PadCommand& command);

    static uint8_t poll_padding(ControllerType type);
private:
    static void encode_fixed(PadCommand& command, const uint8_t* bytes, uint8_t len);

    static constexpr uint8_t ENTER_CONFIG[] = { PAD_ADDR_CONTROLLER, PAD_CMD_CONFIG, 0x00, 0x01, 0x00 };
    static constexpr uint8_t QUERY_MODEL[] = { PAD_ADDR_CONTROLLER, PAD_CMD_QUERY_MODEL, 0x00, 0x5A, 0x5A, 0x5A, 0x5A, 0x5A, 0x5A };
    static constexpr uint8_t ENABLE_ANALOG[] = { PAD_ADDR_CONTROLLER, PAD_CMD_SET_ANALOG, 0x00, 0x01, 0x03, 0x00, 0x00, 0x00, 0x00 };
    static constexpr uint8_t ENABLE_RUMBLE[] = { PAD_ADDR_CONTROLLER, PAD_CMD_MAP_MOTORS, 0x00, 0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFF };
    static constexpr uint8_t ENABLE_PRESSURES[] = { PAD_ADDR_CONTROLLER, PAD_CMD_SET_RESPONSE, 0x00, 0xFF, 0xFF, 0x03, 0x00, 0x00, 0x00 };
    static constexpr uint8_t EXIT_CONFIG[] = { PAD_ADDR_CONTROLLER, PAD_CMD_CONFIG, 0x00, 0x00, 0x5A, 0x5A, 0x5A, 0x5A, 0x5A };
};
