#include <gtest/gtest.h>
#include "emulator/interpreter.hpp"

using namespace vgauge;

class InterpreterTest : public ::testing::Test
{
protected:
    GaugeRegisters regs;
    CommandInterpreter interp{regs};

    void SetUp() override
    {
        regs.pressure.set(100023);
        regs.calibration_1.set(100);
        regs.calibration_2.set(100);
        regs.penning_state = 1;
        regs.penning_sync = 1;
    }
};

TEST_F(InterpreterTest, Type)
{
    EXPECT_EQ(interp.execute(Verb::TYPE, ""), "MTM09D");
}

TEST_F(InterpreterTest, ReadPressure)
{
    EXPECT_EQ(interp.execute(Verb::READ_PRESSURE, ""), "100023");
}

TEST_F(InterpreterTest, WritePressure)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_PRESSURE, "500020"), "500020");
    EXPECT_EQ(regs.pressure.value(), 500020u);
    EXPECT_EQ(interp.execute(Verb::READ_PRESSURE, ""), "500020");
}

TEST_F(InterpreterTest, WriteZeroPressureIsNormalised)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_PRESSURE, "000000"), "000000");
    EXPECT_EQ(interp.execute(Verb::READ_PRESSURE, ""), "000019");
}

TEST_F(InterpreterTest, WritePressureRejectsGarbage)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_PRESSURE, "12x"), "12x");
    EXPECT_EQ(regs.pressure.value(), 100023u);
}

TEST_F(InterpreterTest, ReadSetpoint)
{
    regs.setpoint_2.set(123017);
    EXPECT_EQ(interp.execute(Verb::READ_SETPOINT, "1"), "000000");
    EXPECT_EQ(interp.execute(Verb::READ_SETPOINT, "2"), "123017");
    EXPECT_EQ(interp.execute(Verb::READ_SETPOINT, "3"), "3");
}

TEST_F(InterpreterTest, WriteSetpointTwoStep)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "2"), "2");
    auto* selected = std::get_if<latch::SetpointSelected>(&regs.latch);
    ASSERT_NE(selected, nullptr);
    EXPECT_EQ(selected->slot, 2);

    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "500020"), "500020");
    EXPECT_EQ(regs.setpoint_2.value(), 500020u);
    EXPECT_EQ(regs.setpoint_1.value(), 0u);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(regs.latch));
}

TEST_F(InterpreterTest, WriteSetpointWithoutSelectIsIgnored)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "500020"), "500020");
    EXPECT_EQ(regs.setpoint_1.value(), 0u);
    EXPECT_EQ(regs.setpoint_2.value(), 0u);
}

TEST_F(InterpreterTest, WriteSetpointBadSlot)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "3"), "3");
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(regs.latch));
}

TEST_F(InterpreterTest, BadCodeKeepsLatch)
{
    interp.execute(Verb::WRITE_SETPOINT, "1");
    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "12345x"), "12345x");
    EXPECT_TRUE(std::holds_alternative<latch::SetpointSelected>(regs.latch));
    EXPECT_EQ(regs.setpoint_1.value(), 0u);
}

TEST_F(InterpreterTest, Calibration)
{
    EXPECT_EQ(interp.execute(Verb::READ_CALIBRATION, "1"), "000100");
    EXPECT_EQ(interp.execute(Verb::WRITE_CALIBRATION, "2"), "2");
    EXPECT_EQ(interp.execute(Verb::WRITE_CALIBRATION, "123"), "123");
    EXPECT_EQ(regs.calibration_2.value(), 123u);
    EXPECT_EQ(regs.calibration_1.value(), 100u);
    EXPECT_EQ(interp.execute(Verb::READ_CALIBRATION, "2"), "000123");
    EXPECT_EQ(interp.execute(Verb::READ_CALIBRATION, "0"), "0");
}

TEST_F(InterpreterTest, PenningWords)
{
    EXPECT_EQ(interp.execute(Verb::READ_PENNING_STATE, ""), "000001");
    EXPECT_EQ(interp.execute(Verb::WRITE_PENNING_STATE, "0"), "0");
    EXPECT_EQ(regs.penning_state, 0);
    EXPECT_EQ(interp.execute(Verb::WRITE_PENNING_SYNC, "0"), "0");
    EXPECT_EQ(interp.execute(Verb::READ_PENNING_SYNC, ""), "000000");
    EXPECT_EQ(interp.execute(Verb::WRITE_PENNING_SYNC, "70000"), "70000");
    EXPECT_EQ(regs.penning_sync, 0);
}

TEST_F(InterpreterTest, AdjustAtmosphere)
{
    regs.pressure.set(500020);
    EXPECT_EQ(interp.execute(Verb::ADJUST, "1"), "1");
    EXPECT_TRUE(std::holds_alternative<latch::AtmospherePending>(regs.latch));
    EXPECT_EQ(interp.execute(Verb::ADJUST, "100023"), "100023");
    EXPECT_EQ(regs.pressure.value(), 100023u);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(regs.latch));
}

TEST_F(InterpreterTest, AdjustZero)
{
    interp.execute(Verb::ADJUST, "0");
    EXPECT_EQ(interp.execute(Verb::ADJUST, "000000"), "000000");
    EXPECT_EQ(interp.execute(Verb::READ_PRESSURE, ""), "000019");
}

TEST_F(InterpreterTest, AdjustRejectsWrongReference)
{
    interp.execute(Verb::ADJUST, "1");
    EXPECT_EQ(interp.execute(Verb::ADJUST, "000000"), "");
    EXPECT_TRUE(std::holds_alternative<latch::AtmospherePending>(regs.latch));
    EXPECT_EQ(regs.pressure.value(), 100023u);
}

TEST_F(InterpreterTest, AdjustWithoutArmIsRefused)
{
    EXPECT_EQ(interp.execute(Verb::ADJUST, "100023"), "");
    EXPECT_EQ(interp.execute(Verb::ADJUST, "5"), "5");
}

TEST_F(InterpreterTest, UnknownEchoes)
{
    EXPECT_EQ(interp.execute(Verb::UNKNOWN, "abc"), "abc");
}

TEST_F(InterpreterTest, PressureWriteReadsBack)
{
    EXPECT_EQ(interp.execute(Verb::WRITE_PRESSURE, "987620"), "987620");
    EXPECT_EQ(interp.execute(Verb::READ_PRESSURE, ""), "987620");
}

TEST_F(InterpreterTest, SetpointSelectIsSingleUse)
{
    regs.setpoint_2.set(500020);

    interp.execute(Verb::WRITE_SETPOINT, "1");
    EXPECT_EQ(interp.execute(Verb::WRITE_SETPOINT, "123422"), "123422");
    EXPECT_EQ(regs.setpoint_1.value(), 123422u);
    EXPECT_EQ(regs.setpoint_2.value(), 500020u);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(regs.latch));

    // no select this time
    regs.setpoint_1.set(0);
    interp.execute(Verb::WRITE_SETPOINT, "123422");
    EXPECT_EQ(regs.setpoint_1.value(), 0u);
    EXPECT_EQ(regs.setpoint_2.value(), 500020u);
}

TEST_F(InterpreterTest, AtmosphereOutOfRangeCode)
{
    regs.pressure.set(500020);
    interp.execute(Verb::ADJUST, "1");
    EXPECT_EQ(interp.execute(Verb::ADJUST, "999999"), "");
    EXPECT_EQ(regs.pressure.value(), 500020u);
}
