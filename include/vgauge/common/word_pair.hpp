#pragma once
#include <cstdint>

namespace vgauge {

// Register pairs carry the high word first.
constexpr uint16_t high_word(uint32_t val) {
    return static_cast<uint16_t>((val >> 16) & 0xFFFF);
}

constexpr uint16_t low_word(uint32_t val) {
    return static_cast<uint16_t>(val & 0xFFFF);
}

constexpr uint32_t combine_32bit(uint16_t high, uint16_t low) {
    return (static_cast<uint32_t>(high) << 16) | low;
}

inline void write_words(uint16_t* words, uint32_t val) {
    words[0] = high_word(val);
    words[1] = low_word(val);
}

inline uint32_t read_words(const uint16_t* words) {
    return combine_32bit(words[0], words[1]);
}

} // namespace vgauge
