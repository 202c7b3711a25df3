#pragma once

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "codec/verb.hpp"
#include "codec/protocol_a.hpp"
#include "transport/channel.hpp"
#include "transport/framer.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace vgauge {

// Protocol-A master for one gauge on a shared line.
class GaugeClient
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    GaugeClient(ByteChannel& channel, int address = Protocol::DEFAULT_DEVICE_ID,
                int timeout_ms = Protocol::CLIENT_TIMEOUT_MS);

    Result<std::string> get_model();

    Result<double> measure();
    Result<bool> set_pressure(double value);

    Result<double> get_setpoint(int slot);
    Result<bool> set_setpoint(int slot, double value);

    Result<double> get_calibration(int slot);
    Result<bool> set_calibration(int slot, double value);

    Result<bool> get_penning_state();
    Result<bool> set_penning_state(bool on);
    Result<bool> get_penning_sync();
    Result<bool> set_penning_sync(bool on);

    Result<bool> set_atmosphere();
    Result<bool> set_zero();

    // Reply data of the first frame from our address carrying the same verb.
    Result<std::string> send_command(Verb verb, const std::string& data = "");

    int address() const { return address_; }
    void set_timeout_ms(int timeout_ms) { timeout_ms_ = timeout_ms; }
    void set_log_callback(LogCallback cb);

private:
    ByteChannel& channel_;
    int address_;
    int timeout_ms_;
    AsciiFramer framer_;
    std::mutex mutex_;
    std::mutex log_mutex_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    Result<std::string> transact(const ProtocolACommand& request, std::vector<std::string>& lines);

    Result<bool> apply(Verb verb, const std::string& data);
    Result<bool> select_and_apply(Verb verb, int slot, const std::string& code);
    Result<bool> read_flag(Verb verb);
};

} // namespace vgauge
