#include "transport/framer.hpp"
#include "common/checksum.hpp"
#include <algorithm>

namespace vgauge {

AsciiFramer AsciiFramer::for_dialect(Dialect dialect)
{
    if (dialect == Dialect::PROTOCOL_B) {
        return AsciiFramer(Protocol::MIN_FRAME_SIZE_B);
    }
    return AsciiFramer(Protocol::MIN_FRAME_SIZE_A);
}

DecodedFrame AsciiFramer::decode(const uint8_t* buffer, size_t len) const
{
    DecodedFrame frame;

    if (len < min_size_) {
        return frame;
    }

    const uint8_t* end = std::find(buffer, buffer + len, Protocol::CR);
    if (end == buffer + len) {
        return frame;
    }

    size_t e = static_cast<size_t>(end - buffer);
    frame.consumed = e + 1;

    // id digits and the checksum byte must both precede the CR
    if (e < Protocol::DEVICE_ID_DIGITS + 1) {
        return frame;
    }

    int device_id = 0;
    for (size_t i = 0; i < Protocol::DEVICE_ID_DIGITS; i++) {
        if (buffer[i] < '0' || buffer[i] > '9') {
            return frame;
        }
        device_id = device_id * 10 + (buffer[i] - '0');
    }

    if (!Checksum::verify(buffer, e - 1, buffer[e - 1])) {
        return frame;
    }

    frame.device_id = device_id;
    frame.payload.assign(buffer + Protocol::DEVICE_ID_DIGITS, buffer + e - 1);
    frame.valid = true;
    return frame;
}

std::vector<uint8_t> AsciiFramer::encode(const uint8_t* payload, size_t len, int device_id, uint16_t) const
{
    std::vector<uint8_t> frame;
    frame.reserve(Protocol::DEVICE_ID_DIGITS + len + 2);

    int id = device_id % (Protocol::MAX_DEVICE_ID + 1);
    if (id < 0) {
        id += Protocol::MAX_DEVICE_ID + 1;
    }
    frame.push_back(static_cast<uint8_t>('0' + id / 100));
    frame.push_back(static_cast<uint8_t>('0' + (id / 10) % 10));
    frame.push_back(static_cast<uint8_t>('0' + id % 10));

    frame.insert(frame.end(), payload, payload + len);
    frame.push_back(Checksum::calculate(frame.data(), frame.size()));
    frame.push_back(Protocol::CR);

    return frame;
}

} // namespace vgauge
