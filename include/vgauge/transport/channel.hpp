#pragma once

#include <vector>
#include <stdint.h>
#include <cstddef>

#include "common/types.hpp"

namespace vgauge {

// Exclusive byte pipe to one gauge (or, for the emulator, to one master).
class ByteChannel
{
public:
    virtual ~ByteChannel() = default;

    virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;

    // Whatever arrived within timeout_ms; Error::TIMEOUT when nothing did.
    virtual Result<std::vector<uint8_t>> read(int timeout_ms) = 0;
};

} // namespace vgauge
