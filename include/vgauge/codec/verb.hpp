#pragma once

#include <cstdint>

namespace vgauge {

// Gauge operations, resolved once when a request is decoded.
enum class Verb : uint8_t
{
    TYPE,                  // T
    READ_PRESSURE,         // M
    WRITE_PRESSURE,        // m
    READ_SETPOINT,         // S
    WRITE_SETPOINT,        // s
    READ_CALIBRATION,      // C
    WRITE_CALIBRATION,     // c
    READ_PENNING_STATE,    // I
    WRITE_PENNING_STATE,   // i
    READ_PENNING_SYNC,     // W
    WRITE_PENNING_SYNC,    // w
    ADJUST,                // j
    UNKNOWN
};

Verb resolve_verb_a(char verb);

// Protocol-A wire character; '\0' for UNKNOWN.
char verb_char(Verb verb);

const char* verb_name(Verb verb);

} // namespace vgauge
