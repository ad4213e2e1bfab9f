#pragma once

#include <zephyr/types.h>

#include "PadDriver/PadTypes.hpp"

class PadTransport {
public:
    virtual ~PadTransport() = default;

    // Runs one attention-framed transaction. On error response.len is 0.
    virtual int transfer(const PadCommand& command, RawResponse& response) = 0;
};
