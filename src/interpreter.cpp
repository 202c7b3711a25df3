#include "emulator/interpreter.hpp"
#include "codec/numeric.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"

namespace vgauge {

std::string CommandInterpreter::execute(Verb verb, const std::string& data)
{
    switch (verb) {
        case Verb::TYPE:
            return Protocol::Gauge::MODEL;

        case Verb::READ_PRESSURE:
            return read_code(registers_.pressure);

        case Verb::WRITE_PRESSURE:
            store_pressure(registers_.pressure, data);
            return data;

        case Verb::READ_SETPOINT:
            return read_setpoint(data);

        case Verb::WRITE_SETPOINT:
            return write_setpoint(data);

        case Verb::READ_CALIBRATION:
            return read_calibration(data);

        case Verb::WRITE_CALIBRATION:
            return write_calibration(data);

        case Verb::READ_PENNING_STATE:
            return read_word(registers_.penning_state);

        case Verb::WRITE_PENNING_STATE:
            store_word(registers_.penning_state, data);
            return data;

        case Verb::READ_PENNING_SYNC:
            return read_word(registers_.penning_sync);

        case Verb::WRITE_PENNING_SYNC:
            store_word(registers_.penning_sync, data);
            return data;

        case Verb::ADJUST:
            return adjust(data);

        case Verb::UNKNOWN:
            break;
    }
    return data;
}

std::string CommandInterpreter::read_setpoint(const std::string& data) const
{
    auto slot = parse_slot(data);
    if (!slot) {
        return data;
    }
    return read_code(*registers_.setpoint(*slot));
}

std::string CommandInterpreter::write_setpoint(const std::string& data)
{
    if (data.size() == 1) {
        if (auto slot = parse_slot(data)) {
            registers_.latch = latch::SetpointSelected{*slot};
        }
        return data;
    }

    auto* selected = std::get_if<latch::SetpointSelected>(&registers_.latch);
    if (selected == nullptr || data.size() != Protocol::Pressure::CODE_DIGITS) {
        return data;
    }

    if (store_pressure(*registers_.setpoint(selected->slot), data)) {
        registers_.latch = latch::Idle{};
    }
    return data;
}

std::string CommandInterpreter::read_calibration(const std::string& data) const
{
    auto slot = parse_slot(data);
    if (!slot) {
        return data;
    }
    return zero_padded(registers_.calibration(*slot)->value(), Protocol::Calibration::READ_DIGITS);
}

std::string CommandInterpreter::write_calibration(const std::string& data)
{
    if (data.size() == 1) {
        if (auto slot = parse_slot(data)) {
            registers_.latch = latch::CalibrationSelected{*slot};
        }
        return data;
    }

    auto* selected = std::get_if<latch::CalibrationSelected>(&registers_.latch);
    if (selected == nullptr) {
        return data;
    }

    if (store_calibration(*registers_.calibration(selected->slot), data)) {
        registers_.latch = latch::Idle{};
    }
    return data;
}

std::string CommandInterpreter::adjust(const std::string& data)
{
    if (data == "1") {
        registers_.latch = latch::AtmospherePending{};
        return data;
    }
    if (data == "0") {
        registers_.latch = latch::ZeroPending{};
        return data;
    }
    if (data.size() != Protocol::Pressure::CODE_DIGITS) {
        return data;
    }

    // only the fixed reference codes are accepted; anything else is refused with an empty reply
    const char* expected = nullptr;
    if (std::holds_alternative<latch::AtmospherePending>(registers_.latch)) {
        expected = Protocol::Gauge::ATMOSPHERE_CODE;
    } else if (std::holds_alternative<latch::ZeroPending>(registers_.latch)) {
        expected = Protocol::Gauge::ZERO_CODE;
    }

    if (expected == nullptr || data != expected) {
        return "";
    }
    if (!store_pressure(registers_.pressure, data)) {
        return "";
    }
    registers_.latch = latch::Idle{};
    return data;
}

std::string CommandInterpreter::read_code(const WordPair& pair)
{
    return zero_padded(pair.value(), Protocol::Pressure::CODE_DIGITS);
}

std::string CommandInterpreter::read_word(uint16_t word)
{
    return zero_padded(word, Protocol::Pressure::CODE_DIGITS);
}

bool CommandInterpreter::store_pressure(WordPair& pair, const std::string& data)
{
    auto value = pressure_decode(data);
    if (!value) {
        return false;
    }
    // stored normalised, so a zero written as "000000" reads back as "000019"
    auto code = pressure_encode(*value);
    if (!code.ok()) {
        return false;
    }
    pair.set(static_cast<uint32_t>(*parse_unsigned(code.value())));
    return true;
}

bool CommandInterpreter::store_calibration(WordPair& pair, const std::string& data)
{
    auto value = calibration_decode(data);
    if (!value) {
        return false;
    }
    auto code = calibration_encode(*value);
    if (!code.ok()) {
        return false;
    }
    pair.set(static_cast<uint32_t>(*parse_unsigned(code.value())));
    return true;
}

bool CommandInterpreter::store_word(uint16_t& word, const std::string& data)
{
    auto value = parse_unsigned(data);
    if (!value || *value > 0xFFFF) {
        return false;
    }
    word = static_cast<uint16_t>(*value);
    return true;
}

std::optional<int> CommandInterpreter::parse_slot(const std::string& data)
{
    if (data == "1") return 1;
    if (data == "2") return 2;
    return std::nullopt;
}

} // namespace vgauge
