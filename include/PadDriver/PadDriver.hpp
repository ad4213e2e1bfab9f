#pragma once

#include <zephyr/kernel.h>

#include "PadState.hpp"
#include "PadDriver/PadTypes.hpp"
#include "PadDriver/Transport/PadTransport.hpp"
#include "PadDriver/Negotiator.hpp"
#include "PadDriver/StateTracker.hpp"
#include "PadDriver/RumbleController.hpp"

/** One controller on one pad bus.
 *
 * update() runs a full polling cycle: if the controller is not negotiated yet
 * a presence poll checks that something answers, the config sequence runs, then
 * the regular poll is decoded into events. Failures never escape update():
 * they mark the driver Disconnected, keep the last state, and are returned
 * as a negative errno value so the caller can log them.
 */
class PadDriver {
public:
    PadDriver(PadTransport& transport, const PadOptions& options,
              const NegotiationTiming& timing = Negotiator::default_timing());

    int update(PadEventList& events);

    StickPosition analog_left();
    StickPosition analog_right();
    uint16_t get_buttons();
    ControllerState get_state_copy();
    void get_raw_copy(RawResponse& raw);

    bool is_connected();
    ConnectionStatus get_status();
    ControllerType get_type();
    uint8_t get_model();

    void set_rumble(bool small_motor, uint8_t large_motor);

    uint32_t get_last_cycle_us() const { return last_cycle_us; }

    static PadOptions default_options();
private:
    int connect();
    int poll(PadEventList& events);
    void set_status(ConnectionStatus new_status);
    void set_disconnected(int err);

    struct k_mutex data_mutex;

    PadTransport& transport;
    PadOptions options;

    Negotiator negotiator;
    StateTracker state_tracker;
    RumbleController rumble_controller;

    ConnectionStatus status{ ConnectionStatus::Disconnected };
    ControllerType controller_type{ ControllerType::Unconfigured };

    RawResponse raw_response;

    uint32_t last_cycle_us{ 0 };
};
