#include <string.h>
#include <zephyr/ztest.h>

#include "PadDriver/Protocol/ResponseDecoder.hpp"

static void load(RawResponse& response, const uint8_t* bytes, uint8_t len)
{
    memset(&response, 0, sizeof(response));
    memcpy(response.data, bytes, len);
    response.len = len;
}

ZTEST_SUITE(response_decoder, NULL, NULL, NULL, NULL, NULL);

ZTEST(response_decoder, test_digital_pad)
{
    const uint8_t bytes[] = { 0xFF, 0x41, 0x5A, 0xFF, 0xFF };
    RawResponse response;
    DecodedResponse decoded;

    load(response, bytes, sizeof(bytes));
    zassert_equal(ResponseDecoder::decode(response, decoded), 0);
    zassert_equal(decoded.type, ControllerType::Digital);
    zassert_true(decoded.has_buttons);
    zassert_equal(decoded.buttons, 0);
    zassert_equal(decoded.stick_count, 0);
    zassert_equal(decoded.pressure_count, 0);
}

ZTEST(response_decoder, test_analog_sticks_wire_order)
{
    const uint8_t bytes[] = { 0xFF, 0x73, 0x5A, 0xFF, 0xFF, 0xFF, 0x7F, 0x80, 0x00 };
    RawResponse response;
    DecodedResponse decoded;

    load(response, bytes, sizeof(bytes));
    zassert_equal(ResponseDecoder::decode(response, decoded), 0);
    zassert_equal(decoded.type, ControllerType::DualShock);
    zassert_equal(decoded.stick_count, 4);
    zassert_equal(decoded.sticks[0], 255, "right x");
    zassert_equal(decoded.sticks[1], 127, "right y");
    zassert_equal(decoded.sticks[2], 128, "left x");
    zassert_equal(decoded.sticks[3], 0, "left y");
}

ZTEST(response_decoder, test_buttons_active_low)
{
    const uint16_t patterns[] = { 0x0000, 0xFFFF, 0x0001, 0x8000, 0xA55A, 0x1234 };
    RawResponse response;
    DecodedResponse decoded;

    for (uint16_t pressed : patterns) {
        const uint16_t wire = static_cast<uint16_t>(~pressed);
        const uint8_t bytes[] = { 0xFF, 0x41, 0x5A, static_cast<uint8_t>(wire & 0xFF), static_cast<uint8_t>(wire >> 8) };
        load(response, bytes, sizeof(bytes));
        zassert_equal(ResponseDecoder::decode(response, decoded), 0);
        zassert_equal(decoded.buttons, pressed, "pattern 0x%04x", pressed);
    }

    // Cross is bit 14: second byte, bit 6
    const uint8_t cross[] = { 0xFF, 0x41, 0x5A, 0xFF, 0xBF };
    load(response, cross, sizeof(cross));
    zassert_equal(ResponseDecoder::decode(response, decoded), 0);
    zassert_equal(decoded.buttons, BIT(static_cast<uint8_t>(PadButton::Cross)));
}

ZTEST(response_decoder, test_dualshock2_pressures)
{
    uint8_t bytes[21] = { 0xFF, 0x79, 0x5A, 0xFF, 0xFF, 0x80, 0x80, 0x80, 0x80 };
    for (uint8_t i = 0; i < PAD_PRESSURE_COUNT; i++) {
        bytes[9 + i] = i * 20;
    }
    RawResponse response;
    DecodedResponse decoded;

    load(response, bytes, sizeof(bytes));
    zassert_equal(ResponseDecoder::decode(response, decoded), 0);
    zassert_equal(decoded.type, ControllerType::DualShock2);
    zassert_equal(decoded.stick_count, 4);
    zassert_equal(decoded.pressure_count, PAD_PRESSURE_COUNT);
    zassert_equal(decoded.pressures[static_cast<uint8_t>(PadPressure::Right)], 0);
    zassert_equal(decoded.pressures[static_cast<uint8_t>(PadPressure::Cross)], 120);
    zassert_equal(decoded.pressures[static_cast<uint8_t>(PadPressure::R2)], 220);
}

ZTEST(response_decoder, test_type_table)
{
    zassert_equal(ResponseDecoder::lookup_type(0x41), ControllerType::Digital);
    zassert_equal(ResponseDecoder::lookup_type(0x53), ControllerType::AnalogRed);
    zassert_equal(ResponseDecoder::lookup_type(0x73), ControllerType::DualShock);
    zassert_equal(ResponseDecoder::lookup_type(0x79), ControllerType::DualShock2);
    zassert_equal(ResponseDecoder::lookup_type(0x23), ControllerType::NegCon);
    zassert_equal(ResponseDecoder::lookup_type(0xE3), ControllerType::JogCon);
    zassert_equal(ResponseDecoder::lookup_type(0xF3), ControllerType::Unconfigured);
    zassert_equal(ResponseDecoder::lookup_type(0x12), ControllerType::Unknown);
}

ZTEST(response_decoder, test_unknown_type_keeps_buttons)
{
    // unlisted type code with Select held
    const uint8_t bytes[] = { 0xFF, 0x11, 0x5A, 0xFE, 0xFF };
    RawResponse response;
    DecodedResponse decoded;

    load(response, bytes, sizeof(bytes));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_UNKNOWN_TYPE);
    zassert_equal(decoded.type, ControllerType::Unknown);
    zassert_true(decoded.has_buttons);
    zassert_equal(decoded.buttons, BIT(static_cast<uint8_t>(PadButton::Select)));
    zassert_equal(decoded.stick_count, 0);
}

ZTEST(response_decoder, test_header_rejected)
{
    RawResponse response;
    DecodedResponse decoded;

    const uint8_t bad_idle[] = { 0x00, 0x41, 0x5A, 0xFF, 0xFF };
    load(response, bad_idle, sizeof(bad_idle));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_PROTOCOL);

    const uint8_t bad_marker[] = { 0xFF, 0x41, 0x00, 0xFF, 0xFF };
    load(response, bad_marker, sizeof(bad_marker));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_PROTOCOL);

    const uint8_t truncated[] = { 0xFF, 0x73, 0x5A, 0xFF, 0xFF };
    load(response, truncated, sizeof(truncated));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_PROTOCOL);

    const uint8_t header_only[] = { 0xFF, 0x41 };
    load(response, header_only, sizeof(header_only));
    zassert_equal(ResponseDecoder::check_header(response), PAD_ERR_PROTOCOL);

    // floating data line
    uint8_t idle[PAD_MAX_PACKET_LEN];
    memset(idle, 0xFF, sizeof(idle));
    load(response, idle, sizeof(idle));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_PROTOCOL);
}

ZTEST(response_decoder, test_no_data_words)
{
    const uint8_t bytes[] = { 0xFF, 0x40, 0x5A };
    RawResponse response;
    DecodedResponse decoded;

    load(response, bytes, sizeof(bytes));
    zassert_equal(ResponseDecoder::decode(response, decoded), 0);
    zassert_equal(decoded.type, ControllerType::Digital);
    zassert_false(decoded.has_buttons);
    zassert_equal(decoded.stick_count, 0);

    // 0x41 advertises one word, so a bare header is short
    const uint8_t bare[] = { 0xFF, 0x41, 0x5A };
    load(response, bare, sizeof(bare));
    zassert_equal(ResponseDecoder::decode(response, decoded), PAD_ERR_PROTOCOL);
}
