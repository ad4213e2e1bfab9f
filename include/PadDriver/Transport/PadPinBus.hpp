#pragma once

#include <zephyr/types.h>

// Physical levels of the five pad bus lines. Attention and acknowledge are
// active-low on the wire.
class PadPinBus {
public:
    virtual ~PadPinBus() = default;

    virtual void set_clock(bool level) = 0;
    virtual void set_command(bool level) = 0;
    virtual void set_attention(bool level) = 0;
    virtual bool read_data() = 0;

    virtual bool has_ack() const = 0;
    virtual bool read_ack() = 0;

    virtual void delay_us(uint32_t us) = 0;
};
