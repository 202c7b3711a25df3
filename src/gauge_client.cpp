#include "devices/gauge_client.hpp"
#include "codec/numeric.hpp"
#include "codec/protocol_a.hpp"
#include "common/helpers.hpp"
#include <chrono>

namespace vgauge {

namespace {
    bool valid_slot(int slot)
    {
        return slot >= 1 && slot <= Protocol::Gauge::SLOTS;
    }
}

GaugeClient::GaugeClient(ByteChannel& channel, int address, int timeout_ms)
    : channel_(channel), address_(address), timeout_ms_(timeout_ms) {}

void GaugeClient::set_log_callback(LogCallback cb)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_callback_ = std::move(cb);
}

void GaugeClient::log(const std::string& msg)
{
    LogCallback cb;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        cb = log_callback_;
    }
    if (cb) {
        cb(msg);
    }
}

Result<std::string> GaugeClient::send_command(Verb verb, const std::string& data)
{
    std::vector<std::string> lines;
    Result<std::string> result = Result<std::string>::failure(Error::TIMEOUT);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = transact(ProtocolACommand(verb, data), lines);
    }

    for (const auto& line : lines) {
        log(line);
    }
    return result;
}

Result<std::string> GaugeClient::transact(const ProtocolACommand& request, std::vector<std::string>& lines)
{
    std::vector<uint8_t> frame = framer_.encode(ProtocolACodec::build_payload(request), address_);

    auto write_result = channel_.write(frame.data(), frame.size());
    if (!write_result.ok()) {
        return Result<std::string>::failure(write_result.error());
    }
    lines.push_back("-> " + escape_frame(frame));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::vector<uint8_t> rx;

    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        auto read_result = channel_.read(static_cast<int>(remaining));
        if (!read_result.ok()) {
            if (read_result.error() == Error::TIMEOUT) {
                break;
            }
            return Result<std::string>::failure(read_result.error());
        }
        rx.insert(rx.end(), read_result.value().begin(), read_result.value().end());

        while (!rx.empty())
        {
            DecodedFrame decoded = framer_.decode(rx);
            if (decoded.consumed == 0) {
                break;
            }
            std::vector<uint8_t> raw(rx.begin(), rx.begin() + decoded.consumed);
            rx.erase(rx.begin(), rx.begin() + decoded.consumed);

            if (!decoded.valid) {
                lines.push_back("malformed reply dropped: " + escape_frame(raw));
                continue;
            }
            if (decoded.device_id != address_) {
                continue;
            }

            auto reply = ProtocolACodec::decode(decoded.payload);
            if (!reply || reply->verb() != request.verb()) {
                continue;
            }
            lines.push_back("<- " + escape_frame(raw));
            return Result<std::string>::success(reply->data());
        }
    }

    lines.push_back("timeout waiting for '" + std::string(1, request.verb()) + "' from " + std::to_string(address_));
    return Result<std::string>::failure(Error::TIMEOUT);
}

Result<bool> GaugeClient::apply(Verb verb, const std::string& data)
{
    auto result = send_command(verb, data);
    if (!result.ok()) {
        return Result<bool>::failure(result.error());
    }
    if (result.value() != data) {
        return Result<bool>::failure(Error::CMD_FAILURE);
    }
    return Result<bool>::success(true);
}

Result<bool> GaugeClient::select_and_apply(Verb verb, int slot, const std::string& code)
{
    auto selected = apply(verb, std::to_string(slot));
    if (!selected.ok()) {
        return selected;
    }
    return apply(verb, code);
}

Result<bool> GaugeClient::read_flag(Verb verb)
{
    auto result = send_command(verb);
    if (!result.ok()) {
        return Result<bool>::failure(result.error());
    }
    auto value = parse_unsigned(result.value());
    if (!value) {
        return Result<bool>::failure(Error::PARSE_ERROR);
    }
    return Result<bool>::success(*value != 0);
}

Result<std::string> GaugeClient::get_model()
{
    return send_command(Verb::TYPE);
}

Result<double> GaugeClient::measure()
{
    auto result = send_command(Verb::READ_PRESSURE);
    if (!result.ok()) {
        return Result<double>::failure(result.error());
    }
    auto value = pressure_decode(result.value());
    if (!value) {
        return Result<double>::failure(Error::PARSE_ERROR);
    }
    return Result<double>::success(*value);
}

Result<bool> GaugeClient::set_pressure(double value)
{
    auto code = pressure_encode(value);
    if (!code.ok()) {
        return Result<bool>::failure(code.error());
    }
    return apply(Verb::WRITE_PRESSURE, code.value());
}

Result<double> GaugeClient::get_setpoint(int slot)
{
    if (!valid_slot(slot)) {
        return Result<double>::failure(Error::INVALID_VALUE);
    }
    auto result = send_command(Verb::READ_SETPOINT, std::to_string(slot));
    if (!result.ok()) {
        return Result<double>::failure(result.error());
    }
    auto value = pressure_decode(result.value());
    if (!value) {
        return Result<double>::failure(Error::PARSE_ERROR);
    }
    return Result<double>::success(*value);
}

Result<bool> GaugeClient::set_setpoint(int slot, double value)
{
    if (!valid_slot(slot)) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    auto code = pressure_encode(value);
    if (!code.ok()) {
        return Result<bool>::failure(code.error());
    }
    return select_and_apply(Verb::WRITE_SETPOINT, slot, code.value());
}

Result<double> GaugeClient::get_calibration(int slot)
{
    if (!valid_slot(slot)) {
        return Result<double>::failure(Error::INVALID_VALUE);
    }
    auto result = send_command(Verb::READ_CALIBRATION, std::to_string(slot));
    if (!result.ok()) {
        return Result<double>::failure(result.error());
    }
    auto value = calibration_decode(result.value());
    if (!value) {
        return Result<double>::failure(Error::PARSE_ERROR);
    }
    return Result<double>::success(*value);
}

Result<bool> GaugeClient::set_calibration(int slot, double value)
{
    if (!valid_slot(slot)) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    auto code = calibration_encode(value);
    if (!code.ok()) {
        return Result<bool>::failure(code.error());
    }
    if (code.value().size() > Protocol::ProtocolA::MAX_DATA) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    // a single digit on 'c' is a slot select
    std::string data = code.value();
    if (data.size() < Protocol::Calibration::MIN_WRITE_DIGITS) {
        data.insert(0, Protocol::Calibration::MIN_WRITE_DIGITS - data.size(), '0');
    }
    return select_and_apply(Verb::WRITE_CALIBRATION, slot, data);
}

Result<bool> GaugeClient::get_penning_state()
{
    return read_flag(Verb::READ_PENNING_STATE);
}

Result<bool> GaugeClient::set_penning_state(bool on)
{
    return apply(Verb::WRITE_PENNING_STATE, on ? "1" : "0");
}

Result<bool> GaugeClient::get_penning_sync()
{
    return read_flag(Verb::READ_PENNING_SYNC);
}

Result<bool> GaugeClient::set_penning_sync(bool on)
{
    return apply(Verb::WRITE_PENNING_SYNC, on ? "1" : "0");
}

Result<bool> GaugeClient::set_atmosphere()
{
    auto armed = apply(Verb::ADJUST, "1");
    if (!armed.ok()) {
        return armed;
    }
    return apply(Verb::ADJUST, Protocol::Gauge::ATMOSPHERE_CODE);
}

Result<bool> GaugeClient::set_zero()
{
    auto armed = apply(Verb::ADJUST, "0");
    if (!armed.ok()) {
        return armed;
    }
    return apply(Verb::ADJUST, Protocol::Gauge::ZERO_CODE);
}

} // namespace vgauge
