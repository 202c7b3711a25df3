#pragma once

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "emulator/registers.hpp"
#include "emulator/interpreter.hpp"
#include "transport/channel.hpp"
#include "transport/framer.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vgauge {

class GaugeEmulator
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit GaugeEmulator(int device_id = Protocol::DEFAULT_DEVICE_ID, Dialect dialect = Dialect::PROTOCOL_A);
    ~GaugeEmulator();

    GaugeEmulator(const GaugeEmulator&) = delete;
    GaugeEmulator& operator=(const GaugeEmulator&) = delete;

    int device_id() const { return device_id_; }
    Dialect dialect() const { return dialect_; }

    // Appends to the receive buffer and returns one reply frame per request addressed to us.
    std::vector<std::vector<uint8_t>> feed(const uint8_t* data, size_t len);
    std::vector<std::vector<uint8_t>> feed(const std::vector<uint8_t>& data)
    {
        return feed(data.data(), data.size());
    }

    // Unframed request payload in, unframed reply payload out.
    std::optional<std::vector<uint8_t>> handle_payload(const std::vector<uint8_t>& payload);

    // Serves the channel from a background thread until stop().
    Result<bool> start(ByteChannel& channel);
    void stop();
    bool is_running() const { return running_.load(); }

    double pressure() const;
    Result<bool> set_pressure(double value);
    Result<double> setpoint(int slot) const;
    Result<bool> set_setpoint(int slot, double value);
    Result<double> calibration(int slot) const;
    Result<bool> set_calibration(int slot, double value);
    bool penning_state() const;
    void set_penning_state(bool on);
    bool penning_sync() const;
    void set_penning_sync(bool on);

    GaugeRegisters registers() const;
    RegisterWords register_words() const;
    void load_register_words(const RegisterWords& words);

    void set_log_callback(LogCallback cb);

private:
    int device_id_;
    Dialect dialect_;
    AsciiFramer framer_;
    GaugeRegisters registers_;
    CommandInterpreter interpreter_;
    mutable std::mutex mutex_;
    std::vector<uint8_t> rx_buffer_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex log_mutex_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    void serve(ByteChannel& channel);
    std::optional<std::vector<uint8_t>> dispatch(const std::vector<uint8_t>& payload);
    std::optional<std::vector<uint8_t>> dispatch_a(const std::vector<uint8_t>& payload);
    std::optional<std::vector<uint8_t>> dispatch_b(const std::vector<uint8_t>& payload);
};

} // namespace vgauge
