#include "PadState.hpp"

static const char* const button_names[PAD_BUTTON_COUNT] = {
    "SELECT", "L3", "R3", "START",
    "UP", "RIGHT", "DOWN", "LEFT",
    "L2", "R2", "L1", "R1",
    "TRIANGLE", "CIRCLE", "CROSS", "SQUARE",
};

const char* pad_button_name(PadButton button) {
    const uint8_t idx = static_cast<uint8_t>(button);
    if (idx >= PAD_BUTTON_COUNT) {
        return "?";
    }
    return button_names[idx];
}

const char* controller_type_name(ControllerType type) {
    switch (type)
    {
        case ControllerType::Unconfigured:
            return "Unconfigured";
        case ControllerType::Digital:
            return "Digital";
        case ControllerType::AnalogRed:
            return "AnalogRed";
        case ControllerType::DualShock:
            return "DualShock";
        case ControllerType::DualShock2:
            return "DualShock2";
        case ControllerType::NegCon:
            return "NegCon";
        case ControllerType::JogCon:
            return "JogCon";
        case ControllerType::Unknown:
            break;
    }
    return "Unknown";
}

const char* connection_status_name(ConnectionStatus status) {
    switch (status)
    {
        case ConnectionStatus::Connected:
            return "Connected";
        case ConnectionStatus::Negotiating:
            return "Negotiating";
        case ConnectionStatus::Disconnected:
            break;
    }
    return "Disconnected";
}
