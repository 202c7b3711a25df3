#include "emulator/registers.hpp"

namespace vgauge {

namespace {
    bool valid_slot(uint16_t word)
    {
        return word == 1 || word == 2;
    }

    void store(RegisterWords& words, size_t offset, const WordPair& pair)
    {
        words[offset] = pair.high;
        words[offset + 1] = pair.low;
    }

    WordPair load(const RegisterWords& words, size_t offset)
    {
        WordPair pair;
        pair.high = words[offset];
        pair.low = words[offset + 1];
        return pair;
    }
}

Result<uint32_t> read_pair(const RegisterWords& words, size_t offset)
{
    if (offset + 1 >= words.size()) {
        return Result<uint32_t>::failure(Error::INVALID_VALUE);
    }
    return Result<uint32_t>::success(read_words(words.data() + offset));
}

Result<bool> write_pair(RegisterWords& words, size_t offset, uint32_t value)
{
    if (offset + 1 >= words.size()) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    write_words(words.data() + offset, value);
    return Result<bool>::success(true);
}

WordPair* GaugeRegisters::setpoint(int slot)
{
    if (slot == 1) return &setpoint_1;
    if (slot == 2) return &setpoint_2;
    return nullptr;
}

const WordPair* GaugeRegisters::setpoint(int slot) const
{
    return const_cast<GaugeRegisters*>(this)->setpoint(slot);
}

WordPair* GaugeRegisters::calibration(int slot)
{
    if (slot == 1) return &calibration_1;
    if (slot == 2) return &calibration_2;
    return nullptr;
}

const WordPair* GaugeRegisters::calibration(int slot) const
{
    return const_cast<GaugeRegisters*>(this)->calibration(slot);
}

RegisterWords GaugeRegisters::to_words() const
{
    RegisterWords words{};
    store(words, Reg::PRESSURE, pressure);
    store(words, Reg::SETPOINT_1, setpoint_1);
    store(words, Reg::SETPOINT_2, setpoint_2);
    store(words, Reg::CALIBRATION_1, calibration_1);
    store(words, Reg::CALIBRATION_2, calibration_2);
    words[Reg::PENNING_STATE] = penning_state;
    words[Reg::PENNING_SYNC] = penning_sync;

    if (auto* sp = std::get_if<latch::SetpointSelected>(&latch)) {
        words[Reg::SETPOINT_SELECT] = static_cast<uint16_t>(sp->slot);
    } else if (auto* cal = std::get_if<latch::CalibrationSelected>(&latch)) {
        words[Reg::CALIBRATION_SELECT] = static_cast<uint16_t>(cal->slot);
    } else if (std::holds_alternative<latch::AtmospherePending>(latch)) {
        words[Reg::ATMOSPHERE_SELECT] = 1;
    } else if (std::holds_alternative<latch::ZeroPending>(latch)) {
        words[Reg::ZERO_SELECT] = 1;
    }
    return words;
}

GaugeRegisters GaugeRegisters::from_words(const RegisterWords& words)
{
    GaugeRegisters regs;
    regs.pressure = load(words, Reg::PRESSURE);
    regs.setpoint_1 = load(words, Reg::SETPOINT_1);
    regs.setpoint_2 = load(words, Reg::SETPOINT_2);
    regs.calibration_1 = load(words, Reg::CALIBRATION_1);
    regs.calibration_2 = load(words, Reg::CALIBRATION_2);
    regs.penning_state = words[Reg::PENNING_STATE];
    regs.penning_sync = words[Reg::PENNING_SYNC];

    // an image with several select words set keeps only the first, in offset order
    if (valid_slot(words[Reg::SETPOINT_SELECT])) {
        regs.latch = latch::SetpointSelected{words[Reg::SETPOINT_SELECT]};
    } else if (valid_slot(words[Reg::CALIBRATION_SELECT])) {
        regs.latch = latch::CalibrationSelected{words[Reg::CALIBRATION_SELECT]};
    } else if (words[Reg::ATMOSPHERE_SELECT] != 0) {
        regs.latch = latch::AtmospherePending{};
    } else if (words[Reg::ZERO_SELECT] != 0) {
        regs.latch = latch::ZeroPending{};
    }
    return regs;
}

} // namespace vgauge
