#pragma once

#include "PadState.hpp"
#include "PadDriver/PadTypes.hpp"

class StateTracker final {
public:
    StateTracker();

    // Emits one event per changed button, ascending bit order
    void apply(const DecodedResponse& decoded, PadEventList& events);

    const ControllerState& get_state() const { return state; }

    static void diff_buttons(uint16_t previous, uint16_t current, PadEventList& events);
    static ControllerState neutral_state();
private:
    void copy_analog(const DecodedResponse& decoded);

    ControllerState state;
};
