#pragma once
#include <stdint.h>
#include <cstddef>

namespace vgauge {

namespace Protocol
{
    // Timeouts (ms)
    constexpr int CLIENT_TIMEOUT_MS = 1000;
    constexpr int EMULATOR_POLL_MS = 50;
    constexpr int INTER_BYTE_GAP_MS = 20;

    // Envelope
    constexpr uint8_t CR = '\r';
    constexpr size_t DEVICE_ID_DIGITS = 3;
    constexpr int MAX_DEVICE_ID = 999;
    constexpr int DEFAULT_DEVICE_ID = 1;
    constexpr int DEFAULT_BAUD = 9600;

    // id + checksum + CR must fit before the payload is looked at
    constexpr size_t MIN_FRAME_SIZE_A = 4;
    constexpr size_t MIN_FRAME_SIZE_B = 6;

    namespace ProtocolA {
        constexpr size_t MAX_DATA = 6;
    }

    namespace ProtocolB {
        // <access 1><verb 2><length 2>
        constexpr size_t HEADER_SIZE = 5;
        constexpr size_t VERB_SIZE = 2;
        constexpr size_t MAX_DATA = 99;
    }

    namespace Pressure {
        constexpr size_t CODE_DIGITS = 6;
        constexpr int MANTISSA_SCALE = 1000;
        constexpr int EXPONENT_BIAS = 20;
        constexpr int ZERO_EXPONENT = -1;
    }

    namespace Calibration {
        constexpr int SCALE = 100;
        constexpr size_t READ_DIGITS = 6;
        constexpr size_t MIN_WRITE_DIGITS = 2;
    }

    namespace Gauge {
        constexpr const char* MODEL = "MTM09D";
        constexpr const char* ATMOSPHERE_CODE = "100023";
        constexpr const char* ZERO_CODE = "000000";
        constexpr double DEFAULT_PRESSURE = 1000.0;
        constexpr double DEFAULT_CALIBRATION = 1.0;
        constexpr int SLOTS = 2;
    }
}

} // namespace vgauge
