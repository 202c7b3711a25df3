#include "common/helpers.hpp"
#include "common/types.hpp"
#include <sstream>
#include <iomanip>

namespace vgauge {

const char* error_name(Error error)
{
    switch (error) {
        case Error::TIMEOUT: return "TIMEOUT";
        case Error::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case Error::INVALID_RESPONSE: return "INVALID_RESPONSE";
        case Error::PORT_ERROR: return "PORT_ERROR";
        case Error::CMD_FAILURE: return "CMD_FAILURE";
        case Error::READ_ERROR: return "READ_ERROR";
        case Error::WRITE_ERROR: return "WRITE_ERROR";
        case Error::PARSE_ERROR: return "PARSE_ERROR";
        case Error::INVALID_VALUE: return "INVALID_VALUE";
    }
    return "UNKNOWN";
}

std::string escape_frame(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        if (byte == '\r') {
            oss << "\\r";
        } else if (byte < 0x20 || byte >= 0x7F) {
            oss << "\\x" << std::setw(2) << static_cast<int>(byte);
        } else {
            oss << static_cast<char>(byte);
        }
    }
    return oss.str();
}

std::vector<uint8_t> to_bytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool is_ascii_text(const uint8_t* data, size_t len)
{
    for (size_t i = 0; i < len; ++i) {
        if (data[i] >= 0x80) {
            return false;
        }
    }
    return true;
}

bool is_digits(const std::string& text)
{
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

std::optional<unsigned long> parse_unsigned(const std::string& text)
{
    // at most 9 digits keeps the value inside 32 bits
    if (!is_digits(text) || text.size() > 9) {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    return value;
}

} // namespace vgauge
