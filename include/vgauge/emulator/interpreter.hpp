#pragma once

#include "codec/verb.hpp"
#include "emulator/registers.hpp"
#include <optional>
#include <string>

namespace vgauge {

/*
 * Executes one decoded verb against the register model and returns the reply
 * data. Writes are all-or-nothing: data that does not parse leaves the
 * registers untouched and is echoed back. Unknown verbs echo their data.
 */
class CommandInterpreter
{
public:
    explicit CommandInterpreter(GaugeRegisters& registers) : registers_(registers) {}

    std::string execute(Verb verb, const std::string& data);

private:
    GaugeRegisters& registers_;

    std::string read_setpoint(const std::string& data) const;
    std::string write_setpoint(const std::string& data);
    std::string read_calibration(const std::string& data) const;
    std::string write_calibration(const std::string& data);
    std::string adjust(const std::string& data);

    static std::string read_code(const WordPair& pair);
    static std::string read_word(uint16_t word);
    static bool store_pressure(WordPair& pair, const std::string& data);
    static bool store_calibration(WordPair& pair, const std::string& data);
    static bool store_word(uint16_t& word, const std::string& data);
    static std::optional<int> parse_slot(const std::string& data);
};

} // namespace vgauge
