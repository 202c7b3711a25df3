#pragma once

#include "common/types.hpp"
#include "common/word_pair.hpp"
#include <array>
#include <variant>
#include <cstdint>
#include <cstddef>

namespace vgauge {

// Word offsets of the flat register image.
namespace Reg {
    constexpr size_t PRESSURE = 0;
    constexpr size_t SETPOINT_1 = 2;
    constexpr size_t SETPOINT_2 = 4;
    constexpr size_t CALIBRATION_1 = 6;
    constexpr size_t CALIBRATION_2 = 8;
    constexpr size_t PENNING_STATE = 10;
    constexpr size_t PENNING_SYNC = 11;
    constexpr size_t SETPOINT_SELECT = 12;
    constexpr size_t CALIBRATION_SELECT = 13;
    constexpr size_t ATMOSPHERE_SELECT = 14;
    constexpr size_t ZERO_SELECT = 15;
    constexpr size_t COUNT = 16;
}

using RegisterWords = std::array<uint16_t, Reg::COUNT>;

Result<uint32_t> read_pair(const RegisterWords& words, size_t offset);
Result<bool> write_pair(RegisterWords& words, size_t offset, uint32_t value);

struct WordPair
{
    uint16_t high = 0;
    uint16_t low = 0;

    uint32_t value() const { return combine_32bit(high, low); }

    void set(uint32_t v)
    {
        high = high_word(v);
        low = low_word(v);
    }
};

namespace latch {
    struct Idle {};
    struct SetpointSelected { int slot; };
    struct CalibrationSelected { int slot; };
    struct AtmospherePending {};
    struct ZeroPending {};
}

// Pending target of the next two-step write ("select, then write").
using Latch = std::variant<latch::Idle,
                           latch::SetpointSelected,
                           latch::CalibrationSelected,
                           latch::AtmospherePending,
                           latch::ZeroPending>;

struct GaugeRegisters
{
    WordPair pressure;
    WordPair setpoint_1;
    WordPair setpoint_2;
    WordPair calibration_1;
    WordPair calibration_2;
    uint16_t penning_state = 0;
    uint16_t penning_sync = 0;
    Latch latch = latch::Idle{};

    // slot is 1 or 2; anything else yields nullptr
    WordPair* setpoint(int slot);
    const WordPair* setpoint(int slot) const;
    WordPair* calibration(int slot);
    const WordPair* calibration(int slot) const;

    RegisterWords to_words() const;
    static GaugeRegisters from_words(const RegisterWords& words);
};

} // namespace vgauge
