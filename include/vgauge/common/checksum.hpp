#pragma once
#include <stdint.h>
#include <cstddef>

namespace vgauge {

// Sum of all bytes folded into the printable range 64..127.
class Checksum
{
public:
    static uint8_t calculate(const uint8_t* data, size_t len)
    {
        unsigned int sum = 0;
        for (size_t i = 0; i < len; i++)
            sum += data[i];
        return static_cast<uint8_t>(sum % 64 + 64);
    }

    static bool verify(const uint8_t* data, size_t len, int candidate)
    {
        return calculate(data, len) == candidate;
    }
};

} // namespace vgauge
