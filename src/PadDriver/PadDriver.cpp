#include <string.h>
#include <zephyr/logging/log.h>

#include "PadDriver/PadDriver.hpp"
#include "PadDriver/Protocol/CommandEncoder.hpp"
#include "PadDriver/Protocol/ResponseDecoder.hpp"

LOG_MODULE_REGISTER(PadDriver, LOG_LEVEL_INF);

PadDriver::PadDriver(PadTransport& transport, const PadOptions& options, const NegotiationTiming& timing)
    : transport(transport), options(options), negotiator(transport, timing) {
    k_mutex_init(&data_mutex);
    memset(&raw_response, 0, sizeof(raw_response));
}

PadOptions PadDriver::default_options() {
    return PadOptions{
        .enable_sticks = IS_ENABLED(CONFIG_PSXPAD_ENABLE_STICKS),
        .enable_rumble = IS_ENABLED(CONFIG_PSXPAD_ENABLE_RUMBLE),
        .enable_pressures = IS_ENABLED(CONFIG_PSXPAD_ENABLE_PRESSURES),
        .query_model = IS_ENABLED(CONFIG_PSXPAD_QUERY_MODEL),
    };
}

int PadDriver::update(PadEventList& events) {
    const uint32_t start = k_cycle_get_32();
    int err = 0;

    events.count = 0;

    k_mutex_lock(&data_mutex, K_FOREVER);
    if (!negotiator.is_negotiated()) {
        err = connect();
    }
    if (!err) {
        err = poll(events);
    }
    last_cycle_us = k_cyc_to_us_floor32(k_cycle_get_32() - start);
    k_mutex_unlock(&data_mutex);

    return err;
}

StickPosition PadDriver::analog_left() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    StickPosition ret = state_tracker.get_state().left_stick;
    k_mutex_unlock(&data_mutex);
    return ret;
}

StickPosition PadDriver::analog_right() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    StickPosition ret = state_tracker.get_state().right_stick;
    k_mutex_unlock(&data_mutex);
    return ret;
}

uint16_t PadDriver::get_buttons() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    uint16_t ret = state_tracker.get_state().buttons;
    k_mutex_unlock(&data_mutex);
    return ret;
}

ControllerState PadDriver::get_state_copy() {
    ControllerState ret;
    k_mutex_lock(&data_mutex, K_FOREVER);
    ret = state_tracker.get_state();
    k_mutex_unlock(&data_mutex);
    return ret;
}

void PadDriver::get_raw_copy(RawResponse& raw) {
    k_mutex_lock(&data_mutex, K_FOREVER);
    raw = raw_response;
    k_mutex_unlock(&data_mutex);
}

bool PadDriver::is_connected() {
    return get_status() == ConnectionStatus::Connected;
}

ConnectionStatus PadDriver::get_status() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    ConnectionStatus ret = status;
    k_mutex_unlock(&data_mutex);
    return ret;
}

ControllerType PadDriver::get_type() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    ControllerType ret = controller_type;
    k_mutex_unlock(&data_mutex);
    return ret;
}

uint8_t PadDriver::get_model() {
    k_mutex_lock(&data_mutex, K_FOREVER);
    uint8_t ret = negotiator.get_model();
    k_mutex_unlock(&data_mutex);
    return ret;
}

void PadDriver::set_rumble(bool small_motor, uint8_t large_motor) {
    k_mutex_lock(&data_mutex, K_FOREVER);
    rumble_controller.set_rumble(small_motor, large_motor);
    k_mutex_unlock(&data_mutex);
}

int PadDriver::connect() {
    PadCommand command;
    RawResponse presence;

    CommandEncoder::encode_poll(command, ControllerType::Unconfigured);
    int err = transport.transfer(command, presence);
    if (!err) {
        err = ResponseDecoder::check_header(presence);
    }
    if (err) {
        set_disconnected(err);
        return err;
    }

    set_status(ConnectionStatus::Negotiating);
    err = negotiator.run(options);
    if (err) {
        set_disconnected(err);
        return err;
    }
    rumble_controller.set_mapped(negotiator.is_rumble_mapped());
    return 0;
}

int PadDriver::poll(PadEventList& events) {
    PadCommand command;
    RawResponse response;
    DecodedResponse decoded;
    uint8_t small_motor = 0;
    uint8_t large_motor = 0;

    if (rumble_controller.get_motor_bytes(controller_type, small_motor, large_motor)) {
        CommandEncoder::encode_poll(command, controller_type, small_motor, large_motor);
    } else {
        CommandEncoder::encode_poll(command, controller_type);
    }

    int err = transport.transfer(command, response);
    if (err) {
        set_disconnected(err);
        return err;
    }

    err = ResponseDecoder::decode(response, decoded);
    if (err == PAD_ERR_PROTOCOL) {
        set_disconnected(err);
        return err;
    }

    raw_response = response;

    // still answering in config mode: the exit command was dropped
    if (decoded.type == ControllerType::Unconfigured) {
        LOG_WRN("Controller stuck in config mode (0x%02x)", decoded.type_byte);
        set_disconnected(PAD_ERR_NEGOTIATION);
        return PAD_ERR_NEGOTIATION;
    }

    if (controller_type == ControllerType::Unconfigured) {
        controller_type = decoded.type;
        LOG_INF("Controller type %s (0x%02x)", controller_type_name(controller_type), decoded.type_byte);
    } else if (decoded.type != controller_type) {
        LOG_INF("Controller changed from %s to %s, renegotiating",
                controller_type_name(controller_type), controller_type_name(decoded.type));
        negotiator.reset();
        rumble_controller.set_mapped(false);
        controller_type = ControllerType::Unconfigured;
    }

    state_tracker.apply(decoded, events);
    set_status(ConnectionStatus::Connected);
    return err;
}

void PadDriver::set_status(ConnectionStatus new_status) {
    if (new_status == status) {
        return;
    }
    LOG_INF("%s -> %s", connection_status_name(status), connection_status_name(new_status));
    status = new_status;
}

void PadDriver::set_disconnected(int err) {
    if (status != ConnectionStatus::Disconnected) {
        LOG_WRN("Controller lost, err: %d", err);
    }
    set_status(ConnectionStatus::Disconnected);
    negotiator.reset();
    rumble_controller.set_mapped(false);
    controller_type = ControllerType::Unconfigured;
}
