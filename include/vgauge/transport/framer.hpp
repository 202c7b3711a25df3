#pragma once

#include <vector>
#include <stdint.h>
#include <cstddef>

#include "common/types.hpp"
#include "common/protocol.hpp"

namespace vgauge {

/*
 * One decode step over a receive buffer.
 *  consumed == 0            -> incomplete, keep the bytes and wait
 *  consumed > 0 && !valid   -> malformed frame, drop consumed bytes
 *  consumed > 0 && valid    -> device_id / payload are usable
 */
struct DecodedFrame
{
    size_t consumed = 0;
    int device_id = 0;
    std::vector<uint8_t> payload;
    bool valid = false;
};

// <3-digit id><payload><checksum>\r, no start byte.
class AsciiFramer
{
public:
    explicit AsciiFramer(size_t min_size = Protocol::MIN_FRAME_SIZE_A) : min_size_(min_size) {}

    static AsciiFramer for_dialect(Dialect dialect);

    DecodedFrame decode(const uint8_t* buffer, size_t len) const;
    DecodedFrame decode(const std::vector<uint8_t>& buffer) const
    {
        return decode(buffer.data(), buffer.size());
    }

    // transaction_id is accepted for the host framework and ignored
    std::vector<uint8_t> encode(const uint8_t* payload, size_t len, int device_id, uint16_t transaction_id = 0) const;
    std::vector<uint8_t> encode(const std::vector<uint8_t>& payload, int device_id, uint16_t transaction_id = 0) const
    {
        return encode(payload.data(), payload.size(), device_id, transaction_id);
    }

    size_t min_size() const { return min_size_; }

private:
    size_t min_size_;
};

} // namespace vgauge
