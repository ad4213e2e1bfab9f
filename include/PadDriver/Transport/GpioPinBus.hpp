#pragma once

#include <zephyr/drivers/gpio.h>

#include "PadDriver/Transport/PadPinBus.hpp"

struct PadPins {
    gpio_dt_spec clk;
    gpio_dt_spec cmd;
    gpio_dt_spec att;
    gpio_dt_spec dat;
    gpio_dt_spec ack; // port is NULL when the board does not wire it
};

class GpioPinBus final : public PadPinBus {
public:
    explicit GpioPinBus(const PadPins& pins) : pins(pins) {}

    int init();
    int deinit();

    void set_clock(bool level) override;
    void set_command(bool level) override;
    void set_attention(bool level) override;
    bool read_data() override;

    bool has_ack() const override { return pins.ack.port != nullptr; }
    bool read_ack() override;

    void delay_us(uint32_t us) override;
private:
    const PadPins pins;
};
