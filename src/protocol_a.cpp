#include "codec/protocol_a.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include <algorithm>

namespace vgauge {

ProtocolACommand::ProtocolACommand(char verb, const std::string& data)
    : verb_(verb), kind_(resolve_verb_a(verb))
{
    set_data(data);
}

ProtocolACommand::ProtocolACommand(Verb verb, const std::string& data)
    : verb_(verb_char(verb)), kind_(verb)
{
    set_data(data);
}

void ProtocolACommand::set_data(const std::string& data)
{
    data_ = data.substr(0, std::min(data.size(), Protocol::ProtocolA::MAX_DATA));
}

std::vector<uint8_t> ProtocolACodec::encode(const ProtocolACommand& command)
{
    return to_bytes(command.data());
}

std::vector<uint8_t> ProtocolACodec::build_payload(const ProtocolACommand& command)
{
    std::vector<uint8_t> payload;
    payload.reserve(1 + command.length());
    payload.push_back(static_cast<uint8_t>(command.verb()));
    payload.insert(payload.end(), command.data().begin(), command.data().end());
    return payload;
}

std::optional<ProtocolACommand> ProtocolACodec::decode(const uint8_t* raw, size_t len)
{
    if (len == 0) {
        return std::nullopt;
    }

    size_t data_len = std::min(len - 1, Protocol::ProtocolA::MAX_DATA);
    if (!is_ascii_text(raw, 1 + data_len)) {
        return std::nullopt;
    }

    std::string data(reinterpret_cast<const char*>(raw + 1), data_len);
    return ProtocolACommand(static_cast<char>(raw[0]), data);
}

} // namespace vgauge
