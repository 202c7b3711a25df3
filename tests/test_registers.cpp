#include <gtest/gtest.h>
#include "emulator/registers.hpp"

using namespace vgauge;

TEST(Registers, ImageLayout)
{
    GaugeRegisters regs;
    regs.pressure.set(100023);
    regs.setpoint_2.set(123017);
    regs.calibration_1.set(100);
    regs.penning_state = 1;
    regs.penning_sync = 0;

    RegisterWords words = regs.to_words();
    EXPECT_EQ(words[Reg::PRESSURE], 0x0001);
    EXPECT_EQ(words[Reg::PRESSURE + 1], 0x86B7);
    EXPECT_EQ(read_pair(words, Reg::SETPOINT_2).value(), 123017u);
    EXPECT_EQ(read_pair(words, Reg::CALIBRATION_1).value(), 100u);
    EXPECT_EQ(words[Reg::PENNING_STATE], 1);
    EXPECT_EQ(words[Reg::PENNING_SYNC], 0);
    EXPECT_EQ(words[Reg::SETPOINT_SELECT], 0);
}

TEST(Registers, LatchInImage)
{
    GaugeRegisters regs;
    regs.latch = latch::CalibrationSelected{2};
    EXPECT_EQ(regs.to_words()[Reg::CALIBRATION_SELECT], 2);

    regs.latch = latch::ZeroPending{};
    RegisterWords words = regs.to_words();
    EXPECT_EQ(words[Reg::ZERO_SELECT], 1);
    EXPECT_EQ(words[Reg::CALIBRATION_SELECT], 0);
}

TEST(Registers, FromWords)
{
    RegisterWords words{};
    ASSERT_TRUE(write_pair(words, Reg::SETPOINT_1, 500020).ok());
    words[Reg::PENNING_SYNC] = 1;
    words[Reg::SETPOINT_SELECT] = 1;

    GaugeRegisters regs = GaugeRegisters::from_words(words);
    EXPECT_EQ(regs.setpoint_1.value(), 500020u);
    EXPECT_EQ(regs.penning_sync, 1);
    auto* selected = std::get_if<latch::SetpointSelected>(&regs.latch);
    ASSERT_NE(selected, nullptr);
    EXPECT_EQ(selected->slot, 1);
    EXPECT_EQ(regs.to_words(), words);
}

TEST(Registers, FromWordsIgnoresBadSelect)
{
    RegisterWords words{};
    words[Reg::SETPOINT_SELECT] = 3;
    words[Reg::ATMOSPHERE_SELECT] = 1;
    GaugeRegisters regs = GaugeRegisters::from_words(words);
    EXPECT_TRUE(std::holds_alternative<latch::AtmospherePending>(regs.latch));
}

TEST(Registers, PairBounds)
{
    RegisterWords words{};
    EXPECT_EQ(read_pair(words, Reg::ZERO_SELECT).error(), Error::INVALID_VALUE);
    EXPECT_EQ(write_pair(words, Reg::COUNT, 1).error(), Error::INVALID_VALUE);
}

TEST(Registers, SlotAccess)
{
    GaugeRegisters regs;
    EXPECT_EQ(regs.setpoint(1), &regs.setpoint_1);
    EXPECT_EQ(regs.calibration(2), &regs.calibration_2);
    EXPECT_EQ(regs.setpoint(0), nullptr);
    EXPECT_EQ(regs.calibration(3), nullptr);
}
