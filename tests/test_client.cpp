#include <gtest/gtest.h>
#include "devices/gauge_client.hpp"
#include "emulator/gauge_emulator.hpp"
#include "transport/serial.hpp"
#include "memory_channel.hpp"

using namespace vgauge;
using vgauge::test::bytes;
using vgauge::test::EmulatorChannel;
using vgauge::test::SilentChannel;

class ClientTest : public ::testing::Test
{
protected:
    GaugeEmulator emulator{1};
    EmulatorChannel channel{emulator};
    GaugeClient client{channel, 1, 200};
};

TEST_F(ClientTest, Model)
{
    auto model = client.get_model();
    ASSERT_TRUE(model.ok());
    EXPECT_EQ(model.value(), "MTM09D");
    ASSERT_EQ(channel.written.size(), 1u);
    EXPECT_EQ(channel.written[0], bytes("001Te\r"));
}

TEST_F(ClientTest, MeasureAndWritePressure)
{
    EXPECT_DOUBLE_EQ(client.measure().value(), 1000.0);
    ASSERT_TRUE(client.set_pressure(5.0).ok());
    EXPECT_DOUBLE_EQ(emulator.pressure(), 5.0);
    EXPECT_DOUBLE_EQ(client.measure().value(), 5.0);
}

TEST_F(ClientTest, Setpoints)
{
    ASSERT_TRUE(client.set_setpoint(2, 1.23e-3).ok());
    EXPECT_EQ(channel.written.size(), 2u);
    EXPECT_NEAR(client.get_setpoint(2).value(), 1.23e-3, 1e-12);
    EXPECT_DOUBLE_EQ(client.get_setpoint(1).value(), 0.0);
}

TEST_F(ClientTest, Calibration)
{
    EXPECT_DOUBLE_EQ(client.get_calibration(1).value(), 1.0);
    ASSERT_TRUE(client.set_calibration(1, 1.23).ok());
    EXPECT_DOUBLE_EQ(client.get_calibration(1).value(), 1.23);
    EXPECT_DOUBLE_EQ(emulator.calibration(2).value(), 1.0);
}

TEST_F(ClientTest, SmallCalibrationIsNotTakenForSelect)
{
    ASSERT_TRUE(client.set_calibration(1, 0.05).ok());
    std::string last(channel.written.back().begin(), channel.written.back().end());
    EXPECT_EQ(last.substr(0, 6), "001c05");
    EXPECT_DOUBLE_EQ(emulator.calibration(1).value(), 0.05);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(emulator.registers().latch));

    ASSERT_TRUE(client.set_calibration(2, 0.01).ok());
    EXPECT_DOUBLE_EQ(emulator.calibration(2).value(), 0.01);
    EXPECT_DOUBLE_EQ(emulator.calibration(1).value(), 0.05);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(emulator.registers().latch));
}

TEST_F(ClientTest, ZeroCalibration)
{
    ASSERT_TRUE(client.set_calibration(2, 0.0).ok());
    EXPECT_DOUBLE_EQ(emulator.calibration(2).value(), 0.0);
    EXPECT_DOUBLE_EQ(client.get_calibration(2).value(), 0.0);
    EXPECT_TRUE(std::holds_alternative<latch::Idle>(emulator.registers().latch));
}

TEST_F(ClientTest, InvalidSlotSendsNothing)
{
    EXPECT_EQ(client.get_setpoint(3).error(), Error::INVALID_VALUE);
    EXPECT_EQ(client.set_setpoint(0, 1.0).error(), Error::INVALID_VALUE);
    EXPECT_EQ(client.get_calibration(-1).error(), Error::INVALID_VALUE);
    EXPECT_EQ(client.set_calibration(5, 1.0).error(), Error::INVALID_VALUE);
    EXPECT_TRUE(channel.written.empty());
}

TEST_F(ClientTest, UnencodableValueSendsNothing)
{
    EXPECT_EQ(client.set_pressure(-3.0).error(), Error::INVALID_VALUE);
    EXPECT_EQ(client.set_calibration(1, 1e5).error(), Error::INVALID_VALUE);
    EXPECT_TRUE(channel.written.empty());
}

TEST_F(ClientTest, Penning)
{
    EXPECT_TRUE(client.get_penning_state().value());
    ASSERT_TRUE(client.set_penning_state(false).ok());
    EXPECT_FALSE(client.get_penning_state().value());
    EXPECT_FALSE(emulator.penning_state());

    ASSERT_TRUE(client.set_penning_sync(false).ok());
    EXPECT_FALSE(client.get_penning_sync().value());
}

TEST_F(ClientTest, Adjust)
{
    ASSERT_TRUE(emulator.set_pressure(5.0).ok());
    ASSERT_TRUE(client.set_atmosphere().ok());
    EXPECT_DOUBLE_EQ(emulator.pressure(), 1000.0);

    ASSERT_TRUE(client.set_zero().ok());
    EXPECT_DOUBLE_EQ(emulator.pressure(), 0.0);
    EXPECT_EQ(emulator.register_words()[Reg::PRESSURE + 1], 19);
}

TEST_F(ClientTest, SkipsForeignAndMismatchedReplies)
{
    channel.inject(bytes("002TMTM09DA\r"));
    channel.inject(bytes("001M100023D\r"));
    auto model = client.get_model();
    ASSERT_TRUE(model.ok());
    EXPECT_EQ(model.value(), "MTM09D");
}

TEST_F(ClientTest, UndecodableReplyIsParseError)
{
    channel.inject(bytes("001MabcD\r"));
    EXPECT_EQ(client.measure().error(), Error::PARSE_ERROR);
}

TEST_F(ClientTest, EmptyApplyReplyIsFailure)
{
    channel.inject(bytes("001j{\r"));
    EXPECT_EQ(client.set_atmosphere().error(), Error::CMD_FAILURE);
}

TEST(Client, TimesOut)
{
    SilentChannel silent;
    GaugeClient client(silent, 1, 50);
    std::vector<std::string> log;
    client.set_log_callback([&](const std::string& msg) { log.push_back(msg); });

    EXPECT_EQ(client.get_model().error(), Error::TIMEOUT);
    ASSERT_FALSE(log.empty());
    EXPECT_NE(log.back().find("timeout"), std::string::npos);
}

TEST(Client, AddressesOtherDevice)
{
    GaugeEmulator emulator(7);
    EmulatorChannel channel(emulator);
    GaugeClient wrong(channel, 1, 50);
    EXPECT_EQ(wrong.get_model().error(), Error::TIMEOUT);

    GaugeClient right(channel, 7, 50);
    EXPECT_EQ(right.address(), 7);
    EXPECT_EQ(right.get_model().value(), "MTM09D");
}

TEST(Client, PseudoTerminalRoundTrip)
{
    SerialPort gauge_side;
    auto path = gauge_side.open_virtual();
    if (!path.ok()) {
        GTEST_SKIP() << "no pseudo-terminal available";
    }

    GaugeEmulator emulator;
    ASSERT_TRUE(emulator.start(gauge_side).ok());

    SerialPort host_side;
    ASSERT_TRUE(host_side.open(path.value()).ok());

    GaugeClient client(host_side, 1, 2000);
    auto model = client.get_model();
    emulator.stop();

    ASSERT_TRUE(model.ok()) << error_name(model.error());
    EXPECT_EQ(model.value(), "MTM09D");
}

TEST(Client, LogCallbackMayIssueRequests)
{
    GaugeEmulator emulator;
    EmulatorChannel channel(emulator);
    GaugeClient client(channel, 1, 200);

    bool nested = false;
    std::string nested_model;
    client.set_log_callback([&](const std::string&) {
        if (!nested) {
            nested = true;
            nested_model = client.get_model().value_or("");
        }
    });

    EXPECT_DOUBLE_EQ(client.measure().value(), 1000.0);
    EXPECT_EQ(nested_model, "MTM09D");
}
