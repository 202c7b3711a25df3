#pragma once

#include "codec/verb.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace vgauge {

// Single-character verb plus up to six data characters; longer data is cut.
class ProtocolACommand
{
public:
    ProtocolACommand() = default;
    ProtocolACommand(char verb, const std::string& data = "");
    ProtocolACommand(Verb verb, const std::string& data = "");

    char verb() const { return verb_; }
    Verb kind() const { return kind_; }
    int function_code() const { return static_cast<unsigned char>(verb_); }

    const std::string& data() const { return data_; }
    void set_data(const std::string& data);
    size_t length() const { return data_.size(); }

private:
    char verb_ = '\0';
    Verb kind_ = Verb::UNKNOWN;
    std::string data_;
};

class ProtocolACodec
{
public:
    // Data bytes only; the verb travels in front of them (see build_payload).
    static std::vector<uint8_t> encode(const ProtocolACommand& command);

    // Framer payload: verb byte followed by the data bytes.
    static std::vector<uint8_t> build_payload(const ProtocolACommand& command);

    // nullopt for an empty or non-ASCII payload.
    static std::optional<ProtocolACommand> decode(const uint8_t* raw, size_t len);
    static std::optional<ProtocolACommand> decode(const std::vector<uint8_t>& raw)
    {
        return decode(raw.data(), raw.size());
    }
};

} // namespace vgauge
