#include "PadDriver/RumbleController.hpp"

void RumbleController::set_rumble(bool small_motor, uint8_t large_motor) {
    rumble.small_motor = small_motor;
    rumble.large_motor = large_motor;
}

bool RumbleController::get_motor_bytes(ControllerType type, uint8_t& small_motor, uint8_t& large_motor) const {
    if (!mapped || !supports_rumble(type)) {
        small_motor = 0;
        large_motor = 0;
        return false;
    }
    small_motor = rumble.small_motor ? SMALL_MOTOR_ON : 0x00;
    large_motor = rumble.large_motor;
    return true;
}

bool RumbleController::supports_rumble(ControllerType type) {
    return type == ControllerType::DualShock || type == ControllerType::DualShock2;
}
