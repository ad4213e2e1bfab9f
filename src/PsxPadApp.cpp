#include <zephyr/devicetree.h>
#include <zephyr/logging/log.h>

#include "PsxPadApp.hpp"

LOG_MODULE_REGISTER(psxpad_app, LOG_LEVEL_DBG);

#define PAD_NODE DT_PATH(zephyr_user)

const PadPins PsxPadApp::pad_pins = {
    .clk = GPIO_DT_SPEC_GET(PAD_NODE, psx_clk_gpios),
    .cmd = GPIO_DT_SPEC_GET(PAD_NODE, psx_cmd_gpios),
    .att = GPIO_DT_SPEC_GET(PAD_NODE, psx_att_gpios),
    .dat = GPIO_DT_SPEC_GET(PAD_NODE, psx_dat_gpios),
    .ack = GPIO_DT_SPEC_GET_OR(PAD_NODE, psx_ack_gpios, {0}),
};

PsxPadApp::PsxPadApp()
    : pin_bus(pad_pins),
      transport(pin_bus, BitBangTransport::default_timing()),
      pad(transport, PadDriver::default_options()) {
}

void PsxPadApp::run() {
    int err = pin_bus.init();
    if (err) {
        LOG_ERR("Pad bus init failed (err %d)", err);
        // leave no half-configured outputs driving the bus
        err = pin_bus.deinit();
        if (err) {
            LOG_WRN("Pad bus release failed (err %d)", err);
        }
        k_sleep(K_FOREVER);
    }

    k_thread_create(&input_thread_data, input_stack, K_THREAD_STACK_SIZEOF(input_stack),
                    input_thread_fn, this, NULL, NULL,
                    K_PRIO_COOP(2), 0, K_NO_WAIT);
    k_sleep(K_FOREVER);
}

void PsxPadApp::input_thread_fn(void *arg1, void *arg2, void *arg3) {
    auto *app = static_cast<PsxPadApp *>(arg1);

    int64_t next_tick = k_uptime_get();

    while (true) {
        next_tick += POLL_INTERVAL_MS;
        app->input_loop();
        int64_t now = k_uptime_get();
        if (next_tick <= now) {
            next_tick = now + POLL_INTERVAL_MS;
        }
        k_sleep(K_TIMEOUT_ABS_MS(next_tick));
    }
}

void PsxPadApp::input_loop() {
    PadEventList events;
    int err = pad.update(events);

    const bool connected = pad.is_connected();
    if (connected != was_connected) {
        if (connected) {
            LOG_INF("Controller ready: %s (model 0x%02x)", controller_type_name(pad.get_type()), pad.get_model());
        } else {
            LOG_INF("Controller gone (err %d)", err);
        }
        was_connected = connected;
    }
    if (!connected) {
        return;
    }

    if (IS_ENABLED(CONFIG_PSXPAD_RAW_DUMP)) {
        log_raw();
    }
    if (events.count) {
        log_events(events);
    }
}

void PsxPadApp::log_events(const PadEventList& events) {
    for (uint8_t i = 0; i < events.count; i++) {
        const PadEvent& event = events.events[i];
        LOG_INF("%s %s", pad_button_name(event.button),
                event.transition == ButtonTransition::Pressed ? "pressed" : "released");
    }
    StickPosition left = pad.analog_left();
    StickPosition right = pad.analog_right();
    LOG_INF("Sticks L: (%3d, %3d) R: (%3d, %3d)", left.x, left.y, right.x, right.y);
}

void PsxPadApp::log_raw() {
    RawResponse raw;
    pad.get_raw_copy(raw);
    LOG_HEXDUMP_DBG(raw.data, raw.len, "raw");
    LOG_DBG("cycle %u us", pad.get_last_cycle_us());
}
