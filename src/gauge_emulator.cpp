#include "emulator/gauge_emulator.hpp"
#include "codec/numeric.hpp"
#include "codec/protocol_a.hpp"
#include "codec/protocol_b.hpp"
#include "common/helpers.hpp"

namespace vgauge {

namespace {
    // a line that never sees a CR is noise; stop buffering it at some point
    constexpr size_t MAX_RX_BUFFER = 512;

    Result<bool> store_code(WordPair& pair, const Result<std::string>& code)
    {
        if (!code.ok()) {
            return Result<bool>::failure(code.error());
        }
        auto value = parse_unsigned(code.value());
        if (!value) {
            return Result<bool>::failure(Error::INVALID_VALUE);
        }
        pair.set(static_cast<uint32_t>(*value));
        return Result<bool>::success(true);
    }

    std::optional<double> pressure_of(const WordPair& pair)
    {
        return pressure_decode(zero_padded(pair.value(), Protocol::Pressure::CODE_DIGITS));
    }
}

GaugeEmulator::GaugeEmulator(int device_id, Dialect dialect)
    : device_id_(device_id),
      dialect_(dialect),
      framer_(AsciiFramer::for_dialect(dialect)),
      interpreter_(registers_)
{
    store_code(registers_.pressure, pressure_encode(Protocol::Gauge::DEFAULT_PRESSURE));
    store_code(registers_.calibration_1, calibration_encode(Protocol::Gauge::DEFAULT_CALIBRATION));
    store_code(registers_.calibration_2, calibration_encode(Protocol::Gauge::DEFAULT_CALIBRATION));
    registers_.penning_state = 1;
    registers_.penning_sync = 1;
}

GaugeEmulator::~GaugeEmulator()
{
    stop();
}

void GaugeEmulator::set_log_callback(LogCallback cb)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_callback_ = std::move(cb);
}

void GaugeEmulator::log(const std::string& msg)
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

std::vector<std::vector<uint8_t>> GaugeEmulator::feed(const uint8_t* data, size_t len)
{
    std::vector<std::vector<uint8_t>> replies;
    std::vector<std::string> lines;
    const std::string tag = "[" + std::to_string(device_id_) + "] ";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        rx_buffer_.insert(rx_buffer_.end(), data, data + len);

        while (!rx_buffer_.empty()) {
            DecodedFrame frame = framer_.decode(rx_buffer_);
            if (frame.consumed == 0) {
                if (rx_buffer_.size() > MAX_RX_BUFFER) {
                    lines.push_back(tag + "discarding " + std::to_string(rx_buffer_.size()) + " unterminated bytes");
                    rx_buffer_.clear();
                }
                break;
            }

            std::vector<uint8_t> raw(rx_buffer_.begin(), rx_buffer_.begin() + frame.consumed);
            rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + frame.consumed);

            if (!frame.valid) {
                lines.push_back(tag + "malformed frame dropped: " + escape_frame(raw));
                continue;
            }
            if (frame.device_id != device_id_) {
                continue;
            }

            auto reply = dispatch(frame.payload);
            if (!reply) {
                lines.push_back(tag + "undecodable request: " + escape_frame(raw));
                continue;
            }

            replies.push_back(framer_.encode(*reply, device_id_));
            lines.push_back(tag + escape_frame(raw) + " -> " + escape_frame(replies.back()));
        }
    }

    // callbacks run unlocked so they may query the emulator
    for (const auto& line : lines) {
        log(line);
    }
    return replies;
}

std::optional<std::vector<uint8_t>> GaugeEmulator::handle_payload(const std::vector<uint8_t>& payload)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatch(payload);
}

std::optional<std::vector<uint8_t>> GaugeEmulator::dispatch(const std::vector<uint8_t>& payload)
{
    if (dialect_ == Dialect::PROTOCOL_B) {
        return dispatch_b(payload);
    }
    return dispatch_a(payload);
}

std::optional<std::vector<uint8_t>> GaugeEmulator::dispatch_a(const std::vector<uint8_t>& payload)
{
    auto request = ProtocolACodec::decode(payload);
    if (!request) {
        return std::nullopt;
    }

    std::string output = interpreter_.execute(request->kind(), request->data());
    return ProtocolACodec::build_payload(ProtocolACommand(request->verb(), output));
}

std::optional<std::vector<uint8_t>> GaugeEmulator::dispatch_b(const std::vector<uint8_t>& payload)
{
    ProtocolBCodec codec(ProtocolBCodec::Role::SERVER);
    auto request = codec.decode(payload);
    if (!request) {
        return std::nullopt;
    }

    std::string output = interpreter_.execute(request->kind(), request->data());
    ProtocolBCommand reply(reply_code(request->access_code()), request->verb(), output);
    return ProtocolBCodec::encode(reply);
}

Result<bool> GaugeEmulator::start(ByteChannel& channel)
{
    if (running_.load()) {
        return Result<bool>::failure(Error::CMD_FAILURE);
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    running_.store(true);
    worker_ = std::thread([this, &channel]() { serve(channel); });
    log("[" + std::to_string(device_id_) + "] emulator started");
    return Result<bool>::success(true);
}

void GaugeEmulator::stop()
{
    running_.store(false);
    if (worker_.joinable()) {
        worker_.join();
        log("[" + std::to_string(device_id_) + "] emulator stopped");
    }
}

void GaugeEmulator::serve(ByteChannel& channel)
{
    while (running_.load())
    {
        auto result = channel.read(Protocol::EMULATOR_POLL_MS);
        if (!result.ok()) {
            if (result.error() == Error::TIMEOUT) {
                continue;
            }
            log("[" + std::to_string(device_id_) + "] read failed: " + error_name(result.error()));
            running_.store(false);
            break;
        }

        for (const auto& reply : feed(result.value())) {
            auto written = channel.write(reply.data(), reply.size());
            if (!written.ok()) {
                log("[" + std::to_string(device_id_) + "] write failed: " + error_name(written.error()));
            }
        }
    }
}

double GaugeEmulator::pressure() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pressure_of(registers_.pressure).value_or(0.0);
}

Result<bool> GaugeEmulator::set_pressure(double value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return store_code(registers_.pressure, pressure_encode(value));
}

Result<double> GaugeEmulator::setpoint(int slot) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const WordPair* pair = registers_.setpoint(slot);
    if (pair == nullptr) {
        return Result<double>::failure(Error::INVALID_VALUE);
    }
    auto value = pressure_of(*pair);
    if (!value) {
        return Result<double>::failure(Error::PARSE_ERROR);
    }
    return Result<double>::success(*value);
}

Result<bool> GaugeEmulator::set_setpoint(int slot, double value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    WordPair* pair = registers_.setpoint(slot);
    if (pair == nullptr) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    return store_code(*pair, pressure_encode(value));
}

Result<double> GaugeEmulator::calibration(int slot) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const WordPair* pair = registers_.calibration(slot);
    if (pair == nullptr) {
        return Result<double>::failure(Error::INVALID_VALUE);
    }
    auto value = calibration_decode(std::to_string(pair->value()));
    if (!value) {
        return Result<double>::failure(Error::PARSE_ERROR);
    }
    return Result<double>::success(*value);
}

Result<bool> GaugeEmulator::set_calibration(int slot, double value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    WordPair* pair = registers_.calibration(slot);
    if (pair == nullptr) {
        return Result<bool>::failure(Error::INVALID_VALUE);
    }
    return store_code(*pair, calibration_encode(value));
}

bool GaugeEmulator::penning_state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registers_.penning_state != 0;
}

void GaugeEmulator::set_penning_state(bool on)
{
    std::lock_guard<std::mutex> lock(mutex_);
    registers_.penning_state = on ? 1 : 0;
}

bool GaugeEmulator::penning_sync() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registers_.penning_sync != 0;
}

void GaugeEmulator::set_penning_sync(bool on)
{
    std::lock_guard<std::mutex> lock(mutex_);
    registers_.penning_sync = on ? 1 : 0;
}

GaugeRegisters GaugeEmulator::registers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registers_;
}

RegisterWords GaugeEmulator::register_words() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registers_.to_words();
}

void GaugeEmulator::load_register_words(const RegisterWords& words)
{
    std::lock_guard<std::mutex> lock(mutex_);
    registers_ = GaugeRegisters::from_words(words);
}

} // namespace vgauge
