#include <string.h>
#include <zephyr/logging/log.h>
#include <zephyr/sys/util.h>

#include "PadDriver/Protocol/ResponseDecoder.hpp"

LOG_MODULE_REGISTER(ResponseDecoder, LOG_LEVEL_WRN);

int ResponseDecoder::check_header(const RawResponse& response) {
    if (response.len < PAD_HEADER_LEN) {
        LOG_DBG("Response too short for a header: %d", response.len);
        return PAD_ERR_PROTOCOL;
    }
    if (response.data[0] != PAD_IDLE_BYTE || response.data[2] != PAD_READY_MARKER) {
        LOG_DBG("Bad header %02x %02x %02x", response.data[0], response.data[1], response.data[2]);
        return PAD_ERR_PROTOCOL;
    }
    const uint8_t data_len = pad_data_length(response.data[1]);
    if (response.len < PAD_HEADER_LEN + data_len) {
        LOG_DBG("Short response: %d of %d bytes", response.len, PAD_HEADER_LEN + data_len);
        return PAD_ERR_PROTOCOL;
    }
    return 0;
}

int ResponseDecoder::decode(const RawResponse& response, DecodedResponse& decoded) {
    memset(&decoded, 0, sizeof(decoded));

    int err = check_header(response);
    if (err) {
        return err;
    }

    const uint8_t type_byte = response.data[1];
    const uint8_t* payload = &response.data[PAD_HEADER_LEN];
    uint8_t payload_len = pad_data_length(type_byte);

    decoded.type_byte = type_byte;

    const TypeEntry* entry = find_entry(type_byte);
    if (entry) {
        decoded.type = entry->type;
    } else {
        LOG_WRN("Unknown controller type 0x%02x, decoding buttons only", type_byte);
        decoded.type = ControllerType::Unknown;
        err = PAD_ERR_UNKNOWN_TYPE;
    }

    if (payload_len < 2) {
        return err;
    }
    // active-low on the wire, first byte holds the low bits
    decoded.has_buttons = true;
    decoded.buttons = static_cast<uint16_t>(~(payload[0] | (payload[1] << 8)));
    payload += 2;
    payload_len -= 2;

    if (!entry) {
        return err;
    }

    decoded.stick_count = MIN(payload_len, entry->stick_bytes);
    memcpy(decoded.sticks, payload, decoded.stick_count);
    payload += decoded.stick_count;
    payload_len -= decoded.stick_count;

    decoded.pressure_count = MIN(payload_len, entry->pressure_bytes);
    memcpy(decoded.pressures, payload, decoded.pressure_count);

    return err;
}

ControllerType ResponseDecoder::lookup_type(uint8_t type_byte) {
    const TypeEntry* entry = find_entry(type_byte);
    return entry ? entry->type : ControllerType::Unknown;
}

const ResponseDecoder::TypeEntry* ResponseDecoder::find_entry(uint8_t type_byte) {
    for (const TypeEntry& entry : TYPE_TABLE) {
        if ((type_byte & entry.mask) == entry.code) {
            return &entry;
        }
    }
    return nullptr;
}
