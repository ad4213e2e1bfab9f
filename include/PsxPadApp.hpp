#pragma once

#include <zephyr/kernel.h>

#include "PadDriver/PadDriver.hpp"
#include "PadDriver/Transport/BitBangTransport.hpp"
#include "PadDriver/Transport/GpioPinBus.hpp"

class PsxPadApp {
public:
    PsxPadApp();

    void run();

private:
    static void input_thread_fn(void *arg1, void *arg2, void *arg3);

    void input_loop();
    void log_events(const PadEventList& events);
    void log_raw();

    static const PadPins pad_pins;

    GpioPinBus pin_bus;
    BitBangTransport transport;
    PadDriver pad;

    bool was_connected{ false };

    static inline const uint32_t POLL_INTERVAL_MS = CONFIG_PSXPAD_POLL_INTERVAL_MS;

    struct k_thread input_thread_data;
    K_KERNEL_STACK_MEMBER(input_stack, 1024);
};
