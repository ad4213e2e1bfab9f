#pragma once

#include <zephyr/types.h>

enum class ControllerType : uint8_t {
    Unconfigured = 0,
    Digital,
    AnalogRed,
    DualShock,
    DualShock2,
    NegCon,
    JogCon,
    Unknown,
};

enum class ConnectionStatus : uint8_t {
    Disconnected = 0,
    Negotiating,
    Connected,
};

// Bit index in the decoded button bitmap, wire order
enum class PadButton : uint8_t {
    Select = 0,
    L3,
    R3,
    Start,
    Up,
    Right,
    Down,
    Left,
    L2,
    R2,
    L1,
    R1,
    Triangle,
    Circle,
    Cross,
    Square,
};

// Index in the pressure array, wire order
enum class PadPressure : uint8_t {
    Right = 0,
    Left,
    Up,
    Down,
    Triangle,
    Circle,
    Cross,
    Square,
    L1,
    R1,
    L2,
    R2,
};

static constexpr uint8_t PAD_BUTTON_COUNT = 16;
static constexpr uint8_t PAD_PRESSURE_COUNT = 12;
static constexpr uint8_t STICK_NEUTRAL = 128;
static constexpr uint8_t PRESSURE_NEUTRAL = 0;

struct StickPosition {
    uint8_t x;
    uint8_t y;
};

struct ControllerState {
    uint16_t buttons; // bit set = pressed, see PadButton
    StickPosition left_stick;
    StickPosition right_stick;
    uint8_t pressures[PAD_PRESSURE_COUNT];
};

enum class ButtonTransition : uint8_t {
    Pressed,
    Released,
};

struct PadEvent {
    PadButton button;
    ButtonTransition transition;
};

// One cycle can flip every button at most once
struct PadEventList {
    PadEvent events[PAD_BUTTON_COUNT];
    uint8_t count;
};

struct RumbleData {
    bool small_motor;
    uint8_t large_motor;
};

struct PadOptions {
    bool enable_sticks;
    bool enable_rumble;
    bool enable_pressures;
    bool query_model;
};

const char* pad_button_name(PadButton button);
const char* controller_type_name(ControllerType type);
const char* connection_status_name(ConnectionStatus status);
