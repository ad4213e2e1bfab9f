#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>
#include <zephyr/sys/util.h>

#include "PadDriver/Negotiator.hpp"
#include "PadDriver/Protocol/CommandEncoder.hpp"
#include "PadDriver/Protocol/ResponseDecoder.hpp"

LOG_MODULE_REGISTER(Negotiator, LOG_LEVEL_INF);

Negotiator::Negotiator(PadTransport& transport, const NegotiationTiming& timing)
    : transport(transport),
      max_attempts(MAX(timing.max_attempts, 1)),
      step_delay_ms(timing.step_delay_ms) {
}

NegotiationTiming Negotiator::default_timing() {
    return NegotiationTiming{
        .step_delay_ms = CONFIG_PSXPAD_CONFIG_DELAY_MS,
        .max_attempts = CONFIG_PSXPAD_CONFIG_ATTEMPTS,
    };
}

int Negotiator::run(const PadOptions& options) {
    rumble_mapped = false;

    if (!options.enable_sticks) {
        LOG_DBG("Sticks disabled, staying in digital mode");
        state = NegotiationState::Negotiated;
        return 0;
    }

    for (uint8_t attempt = 1; attempt <= max_attempts; attempt++) {
        int err = run_sequence(options);
        if (!err) {
            LOG_DBG("Negotiated (rumble %d, pressures %d, model 0x%02x)",
                    options.enable_rumble, options.enable_pressures, model);
            return 0;
        }

        LOG_WRN("Negotiation failed in %s (attempt %d/%d), err: %d",
                state_name(state), attempt, max_attempts, err);
        if (step_delay_ms < MAX_STEP_DELAY_MS) {
            step_delay_ms += DELAY_GROWTH_MS;
            LOG_INF("Config settle delay now %u ms", step_delay_ms);
        }
    }

    reset();
    return PAD_ERR_NEGOTIATION;
}

void Negotiator::reset() {
    state = NegotiationState::Idle;
    rumble_mapped = false;
    model = 0;
}

int Negotiator::run_sequence(const PadOptions& options) {
    PadCommand command;
    RawResponse response;

    rumble_mapped = false;
    model = 0;

    state = NegotiationState::EnteringConfig;
    while (state != NegotiationState::Negotiated) {
        switch (state) {
            case NegotiationState::EnteringConfig:
                CommandEncoder::encode_enter_config(command);
                break;
            case NegotiationState::QueryingModel:
                CommandEncoder::encode_query_model(command);
                break;
            case NegotiationState::EnablingAnalog:
                CommandEncoder::encode_enable_analog(command);
                break;
            case NegotiationState::EnablingRumble:
                CommandEncoder::encode_enable_rumble(command);
                break;
            case NegotiationState::EnablingPressures:
                CommandEncoder::encode_enable_pressures(command);
                break;
            case NegotiationState::ExitingConfig:
                CommandEncoder::encode_exit_config(command);
                break;
            default:
                return PAD_ERR_NEGOTIATION;
        }

        int err = send_step(command, response);
        if (err) {
            return err;
        }

        if (state == NegotiationState::QueryingModel && response.len > PAD_MODEL_POS) {
            model = response.data[PAD_MODEL_POS];
        } else if (state == NegotiationState::EnablingRumble) {
            rumble_mapped = true;
        }
        state = next_state(state, options);
    }
    return 0;
}

int Negotiator::send_step(const PadCommand& command, RawResponse& response) {
    int err = transport.transfer(command, response);
    if (step_delay_ms) {
        k_msleep(step_delay_ms);
    }
    if (err) {
        return err;
    }
    return ResponseDecoder::check_header(response);
}

NegotiationState Negotiator::next_state(NegotiationState current, const PadOptions& options) {
    switch (current) {
        case NegotiationState::EnteringConfig:
            if (options.query_model) {
                return NegotiationState::QueryingModel;
            }
            [[fallthrough]];
        case NegotiationState::QueryingModel:
            return NegotiationState::EnablingAnalog;
        case NegotiationState::EnablingAnalog:
            if (options.enable_rumble) {
                return NegotiationState::EnablingRumble;
            }
            [[fallthrough]];
        case NegotiationState::EnablingRumble:
            if (options.enable_pressures) {
                return NegotiationState::EnablingPressures;
            }
            [[fallthrough]];
        case NegotiationState::EnablingPressures:
            return NegotiationState::ExitingConfig;
        case NegotiationState::ExitingConfig:
            return NegotiationState::Negotiated;
        default:
            break;
    }
    return NegotiationState::Idle;
}

const char* Negotiator::state_name(NegotiationState state) {
    switch (state) {
        case NegotiationState::Idle:
            return "Idle";
        case NegotiationState::EnteringConfig:
            return "EnteringConfig";
        case NegotiationState::QueryingModel:
            return "QueryingModel";
        case NegotiationState::EnablingAnalog:
            return "EnablingAnalog";
        case NegotiationState::EnablingRumble:
            return "EnablingRumble";
        case NegotiationState::EnablingPressures:
            return "EnablingPressures";
        case NegotiationState::ExitingConfig:
            return "ExitingConfig";
        case NegotiationState::Negotiated:
            return "Negotiated";
    }
    return "?";
}
