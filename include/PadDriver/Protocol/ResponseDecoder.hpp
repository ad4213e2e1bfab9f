#pragma once

#include "PadDriver/PadTypes.hpp"

class ResponseDecoder final {
public:
    /** Decodes one poll response.
     *
     * Returns 0, PAD_ERR_PROTOCOL for a bad header or a short response, or
     * PAD_ERR_UNKNOWN_TYPE when the type code is not in the table. In the last
     * case the button bitmap is still decoded and `decoded` is usable.
     */
    static int decode(const RawResponse& response, DecodedResponse& decoded);

    // Header only: idle byte, ready marker and advertised length
    static int check_header(const RawResponse& response);

    static ControllerType lookup_type(uint8_t type_byte);
private:
    struct TypeEntry {
        uint8_t mask;
        uint8_t code;
        ControllerType type;
        uint8_t stick_bytes;
        uint8_t pressure_bytes;
    };

    static const TypeEntry* find_entry(uint8_t type_byte);

    // First match wins, so the exact DualShock 2 pressure mode comes first
    static constexpr TypeEntry TYPE_TABLE[] = {
        { 0xFF, 0x79, ControllerType::DualShock2, PAD_STICK_BYTES, PAD_PRESSURE_COUNT },
        { 0xF0, 0x70, ControllerType::DualShock, PAD_STICK_BYTES, 0 },
        { 0xF0, 0x40, ControllerType::Digital, 0, 0 },
        { 0xF0, 0x50, ControllerType::AnalogRed, PAD_STICK_BYTES, 0 },
        { 0xF0, 0x20, ControllerType::NegCon, PAD_STICK_BYTES, 0 },
        { 0xF0, 0xE0, ControllerType::JogCon, PAD_STICK_BYTES, 0 },
        { 0xF0, 0xF0, ControllerType::Unconfigured, 0, 0 },
    };
};
