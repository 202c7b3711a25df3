#include "codec/protocol_b.hpp"
#include "codec/numeric.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include <algorithm>

namespace vgauge {

namespace {

struct MnemonicEntry
{
    const char* mnemonic;
    Verb read;
    Verb write;
};

constexpr MnemonicEntry MNEMONICS[] = {
    {"TD", Verb::TYPE,               Verb::UNKNOWN},
    {"MV", Verb::READ_PRESSURE,      Verb::WRITE_PRESSURE},
    {"SP", Verb::READ_SETPOINT,      Verb::WRITE_SETPOINT},
    {"CA", Verb::READ_CALIBRATION,   Verb::WRITE_CALIBRATION},
    {"PE", Verb::READ_PENNING_STATE, Verb::WRITE_PENNING_STATE},
    {"PS", Verb::READ_PENNING_SYNC,  Verb::WRITE_PENNING_SYNC},
    {"AJ", Verb::UNKNOWN,            Verb::ADJUST},
};

struct ErrorEntry
{
    ErrorMessage message;
    const char* text;
    const char* description;
};

constexpr ErrorEntry ERRORS[] = {
    {ErrorMessage::NO_DEF, "NO_DEF", "Command is not valid (not defined) for device."},
    {ErrorMessage::LOGIC, "_LOGIC", "Access Code is not valid or execution of command is not logical."},
    {ErrorMessage::RANGE, "_RANGE", "Value in send request is out of range."},
    {ErrorMessage::SENSOR_ERROR, "ERROR1", "Sensor is defect or stacked out."},
    {ErrorMessage::SYNTAX, "SYNTAX", "Command is valid, but the syntax in data is wrong "
                                     "or the selected mode in data is not valid for your device."},
    {ErrorMessage::LENGTH, "LENGTH", "Command is valid, but the length of data is out of expected range."},
    {ErrorMessage::CD_RE, "_CD_RE", "Calibration data read error."},
    {ErrorMessage::EP_RE, "_EP_RE", "EEPROM Read Error."},
    {ErrorMessage::UNSUPPORTED_DATA, "_UNSUP", "Unsupported Data (not valid value)."},
    {ErrorMessage::SENSOR_DISABLED, "_SEDIS", "Sensor element disabled."},
};

const ErrorEntry* find_error(ErrorMessage message)
{
    for (const auto& entry : ERRORS) {
        if (entry.message == message) {
            return &entry;
        }
    }
    return nullptr;
}

} // anonymous namespace

std::optional<AccessCode> access_code_from_int(int value)
{
    switch (value) {
        case 0: return AccessCode::READ;
        case 2: return AccessCode::WRITE;
        case 4: return AccessCode::FACTORY_DEFAULT;
        case 6: return AccessCode::STREAMING;
        case 7: return AccessCode::ERROR;
        case 8: return AccessCode::BINARY;
        default: return std::nullopt;
    }
}

AccessCode reply_code(AccessCode request)
{
    if (request == AccessCode::STREAMING || request == AccessCode::ERROR) {
        return request;
    }
    // the raw digit of a reply is not itself a request code, hence the cast
    return static_cast<AccessCode>(static_cast<uint8_t>(request) + 1);
}

std::optional<ErrorMessage> parse_error_message(const std::string& text)
{
    for (const auto& entry : ERRORS) {
        if (text == entry.text) {
            return entry.message;
        }
    }
    return std::nullopt;
}

const char* error_message_text(ErrorMessage message)
{
    const ErrorEntry* entry = find_error(message);
    return entry ? entry->text : "";
}

const char* describe(ErrorMessage message)
{
    const ErrorEntry* entry = find_error(message);
    return entry ? entry->description : "";
}

Verb resolve_verb_b(AccessCode access_code, const std::string& verb)
{
    for (const auto& entry : MNEMONICS) {
        if (verb != entry.mnemonic) {
            continue;
        }
        if (access_code == AccessCode::READ) {
            return entry.read;
        }
        if (access_code == AccessCode::WRITE) {
            return entry.write;
        }
        return Verb::UNKNOWN;
    }
    return Verb::UNKNOWN;
}

std::string verb_mnemonic(Verb verb)
{
    if (verb == Verb::UNKNOWN) {
        return std::string();
    }
    for (const auto& entry : MNEMONICS) {
        if (entry.read == verb || entry.write == verb) {
            return entry.mnemonic;
        }
    }
    return std::string();
}

ProtocolBCommand::ProtocolBCommand(AccessCode access_code, const std::string& verb, const std::string& data)
    : access_code_(access_code),
      verb_(verb.substr(0, std::min(verb.size(), Protocol::ProtocolB::VERB_SIZE)))
{
    // the header is fixed width; a short verb is space padded
    verb_.resize(Protocol::ProtocolB::VERB_SIZE, ' ');
    set_data(data);
}

void ProtocolBCommand::set_data(const std::string& data)
{
    data_ = data.substr(0, std::min(data.size(), Protocol::ProtocolB::MAX_DATA));
}

std::optional<ErrorMessage> ProtocolBCommand::error_message() const
{
    if (!is_error()) {
        return std::nullopt;
    }
    return parse_error_message(data_);
}

std::optional<ProtocolBCommand> ProtocolBCodec::decode(const uint8_t* raw, size_t len) const
{
    if (len < Protocol::ProtocolB::HEADER_SIZE || !is_ascii_text(raw, Protocol::ProtocolB::HEADER_SIZE)) {
        return std::nullopt;
    }

    if (raw[0] < '0' || raw[0] > '9') {
        return std::nullopt;
    }
    int digit = raw[0] - '0';
    if (role_ == Role::CLIENT && digit != 6 && digit != 7) {
        digit -= 1;
    }
    auto access_code = access_code_from_int(digit);
    if (!access_code) {
        return std::nullopt;
    }

    std::string verb(reinterpret_cast<const char*>(raw + 1), Protocol::ProtocolB::VERB_SIZE);

    auto length = parse_unsigned(std::string(reinterpret_cast<const char*>(raw + 3), 2));
    if (!length) {
        return std::nullopt;
    }

    size_t data_end = Protocol::ProtocolB::HEADER_SIZE + *length;
    if (data_end > len || !is_ascii_text(raw + Protocol::ProtocolB::HEADER_SIZE, *length)) {
        return std::nullopt;
    }

    std::string data(reinterpret_cast<const char*>(raw + Protocol::ProtocolB::HEADER_SIZE), *length);
    return ProtocolBCommand(*access_code, verb, data);
}

std::vector<uint8_t> ProtocolBCodec::encode(const ProtocolBCommand& command)
{
    std::string payload;
    payload.push_back(static_cast<char>('0' + static_cast<int>(command.access_code())));
    payload += command.verb();
    payload += zero_padded(command.length(), 2);
    payload += command.data();
    return to_bytes(payload);
}

} // namespace vgauge
