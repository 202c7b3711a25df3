#pragma once

#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace vgauge {

// Printable rendering of a raw frame for log lines, e.g. "001T\x55\r".
std::string escape_frame(const std::vector<uint8_t>& data);

std::vector<uint8_t> to_bytes(const std::string& text);

bool is_ascii_text(const uint8_t* data, size_t len);
bool is_digits(const std::string& text);

std::optional<unsigned long> parse_unsigned(const std::string& text);

} // namespace vgauge
