#pragma once

#include "PadState.hpp"
#include "PadDriver/PadTypes.hpp"
#include "PadDriver/Transport/PadTransport.hpp"

enum class NegotiationState : uint8_t {
    Idle,
    EnteringConfig,
    QueryingModel,
    EnablingAnalog,
    EnablingRumble,
    EnablingPressures,
    ExitingConfig,
    Negotiated,
};

struct NegotiationTiming {
    uint32_t step_delay_ms; // settle time after each config command
    uint8_t max_attempts;
};

class Negotiator final {
public:
    Negotiator(PadTransport& transport, const NegotiationTiming& timing);

    /** Walks the config sequence to Negotiated.
     *
     * A failed attempt restarts the sequence from EnteringConfig with the
     * settle delay grown by DELAY_GROWTH_MS. The grown delay is kept for
     * later connections. After max_attempts failures the state goes back to
     * Idle and PAD_ERR_NEGOTIATION is returned.
     */
    int run(const PadOptions& options);
    void reset();

    NegotiationState get_state() const { return state; }
    bool is_negotiated() const { return state == NegotiationState::Negotiated; }
    bool is_rumble_mapped() const { return rumble_mapped; }
    uint8_t get_model() const { return model; }
    uint32_t get_step_delay_ms() const { return step_delay_ms; }

    static NegotiationTiming default_timing();
    static const char* state_name(NegotiationState state);
private:
    int run_sequence(const PadOptions& options);
    int send_step(const PadCommand& command, RawResponse& response);
    static NegotiationState next_state(NegotiationState current, const PadOptions& options);

    PadTransport& transport;
    const uint8_t max_attempts;
    uint32_t step_delay_ms;

    NegotiationState state{ NegotiationState::Idle };
    bool rumble_mapped{ false };
    uint8_t model{ 0 };

    static inline const uint32_t DELAY_GROWTH_MS = 1;
    static inline const uint32_t MAX_STEP_DELAY_MS = 16;
};
