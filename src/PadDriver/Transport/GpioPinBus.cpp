#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include "PadDriver/Transport/GpioPinBus.hpp"

LOG_MODULE_REGISTER(GpioPinBus, LOG_LEVEL_WRN);

int GpioPinBus::init() {
    int ret = 0;
    const gpio_dt_spec* outputs[] = { &pins.clk, &pins.cmd, &pins.att };
    for (const gpio_dt_spec* pin : outputs) {
        if (!gpio_is_ready_dt(pin))
        {
            LOG_ERR("Output pin %d not ready", pin->pin);
            return -ENODEV;
        }
        // clock, command and attention all idle high
        ret = gpio_pin_configure_dt(pin, GPIO_OUTPUT_HIGH);
        if (ret) {
            return ret;
        }
    }

    if (!gpio_is_ready_dt(&pins.dat))
    {
        LOG_ERR("Data pin not ready");
        return -ENODEV;
    }
    ret = gpio_pin_configure_dt(&pins.dat, GPIO_INPUT);
    if (ret) {
        return ret;
    }

    if (has_ack()) {
        if (!gpio_is_ready_dt(&pins.ack))
        {
            LOG_ERR("Ack pin not ready");
            return -ENODEV;
        }
        ret = gpio_pin_configure_dt(&pins.ack, GPIO_INPUT);
        if (ret) {
            return ret;
        }
    } else {
        LOG_WRN("No ack line wired, relying on header checks");
    }
    return 0;
}

int GpioPinBus::deinit() {
    int ret = 0;
    const gpio_dt_spec* all_pins[] = { &pins.clk, &pins.cmd, &pins.att, &pins.dat, &pins.ack };
    for (const gpio_dt_spec* pin : all_pins) {
        // never configured by init(), nothing to release
        if (pin->port == nullptr || !gpio_is_ready_dt(pin)) {
            continue;
        }
        ret = gpio_pin_configure_dt(pin, GPIO_DISCONNECTED);
        if (ret)
        {
            return ret;
        }
    }
    return 0;
}

void GpioPinBus::set_clock(bool level) {
    gpio_pin_set_dt(&pins.clk, level);
}

void GpioPinBus::set_command(bool level) {
    gpio_pin_set_dt(&pins.cmd, level);
}

void GpioPinBus::set_attention(bool level) {
    gpio_pin_set_dt(&pins.att, level);
}

bool GpioPinBus::read_data() {
    return gpio_pin_get_dt(&pins.dat) > 0;
}

bool GpioPinBus::read_ack() {
    return gpio_pin_get_dt(&pins.ack) > 0;
}

void GpioPinBus::delay_us(uint32_t us) {
    k_busy_wait(us);
}
