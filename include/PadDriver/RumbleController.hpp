#pragma once

#include "PadState.hpp"

class RumbleController final {
public:
    void set_rumble(bool small_motor, uint8_t large_motor);
    RumbleData get_rumble() const { return rumble; }

    // Set by negotiation once the motor mapping command was accepted
    void set_mapped(bool is_mapped) { mapped = is_mapped; }
    bool is_mapped() const { return mapped; }

    // Motor bytes for the next poll; false when the type ignores them
    bool get_motor_bytes(ControllerType type, uint8_t& small_motor, uint8_t& large_motor) const;

    static bool supports_rumble(ControllerType type);
private:
    RumbleData rumble{ false, 0 };
    bool mapped{ false };

    static inline const uint8_t SMALL_MOTOR_ON = 0xFF;
};
