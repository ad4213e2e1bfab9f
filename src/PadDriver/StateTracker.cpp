#include <string.h>
#include <zephyr/sys/util.h>

#include "PadDriver/StateTracker.hpp"

StateTracker::StateTracker() {
    state = neutral_state();
}

ControllerState StateTracker::neutral_state() {
    ControllerState neutral;
    neutral.buttons = 0;
    neutral.left_stick = { STICK_NEUTRAL, STICK_NEUTRAL };
    neutral.right_stick = { STICK_NEUTRAL, STICK_NEUTRAL };
    memset(neutral.pressures, PRESSURE_NEUTRAL, sizeof(neutral.pressures));
    return neutral;
}

void StateTracker::apply(const DecodedResponse& decoded, PadEventList& events) {
    events.count = 0;
    if (decoded.has_buttons) {
        diff_buttons(state.buttons, decoded.buttons, events);
        state.buttons = decoded.buttons;
    }
    copy_analog(decoded);
}

void StateTracker::diff_buttons(uint16_t previous, uint16_t current, PadEventList& events) {
    const uint16_t changed = previous ^ current;
    for (uint8_t bit = 0; bit < PAD_BUTTON_COUNT; bit++) {
        if (!(changed & BIT(bit))) {
            continue;
        }
        PadEvent& event = events.events[events.count++];
        event.button = static_cast<PadButton>(bit);
        event.transition = (current & BIT(bit)) ? ButtonTransition::Pressed : ButtonTransition::Released;
    }
}

void StateTracker::copy_analog(const DecodedResponse& decoded) {
    // wire order: right x, right y, left x, left y
    uint8_t sticks[PAD_STICK_BYTES] = { STICK_NEUTRAL, STICK_NEUTRAL, STICK_NEUTRAL, STICK_NEUTRAL };
    memcpy(sticks, decoded.sticks, decoded.stick_count);
    state.right_stick = { sticks[0], sticks[1] };
    state.left_stick = { sticks[2], sticks[3] };

    memset(state.pressures, PRESSURE_NEUTRAL, sizeof(state.pressures));
    memcpy(state.pressures, decoded.pressures, decoded.pressure_count);
}
