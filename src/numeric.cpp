#include "codec/numeric.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace vgauge {

namespace {
    constexpr double MAX_CALIBRATION_CODE = 4294967295.0;

    double power_of_ten(int exponent)
    {
        return std::pow(10.0, static_cast<double>(exponent));
    }
}

Result<int> exponent_of(double value)
{
    if (!std::isfinite(value)) {
        return Result<int>::failure(Error::INVALID_VALUE);
    }
    if (value == 0.0) {
        return Result<int>::success(0);
    }

    // printf does the decimal normalisation without log10 rounding surprises
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.14e", std::fabs(value));
    const char* e = std::strchr(buf, 'e');
    if (e == nullptr) {
        return Result<int>::failure(Error::INVALID_VALUE);
    }
    return Result<int>::success(static_cast<int>(std::strtol(e + 1, nullptr, 10)));
}

Result<double> mantissa_of(double value)
{
    auto exponent = exponent_of(value);
    if (!exponent.ok()) {
        return Result<double>::failure(exponent.error());
    }
    if (value == 0.0) {
        return Result<double>::success(0.0);
    }
    return Result<double>::success(std::fabs(value) / power_of_ten(exponent.value()));
}

Result<std::string> pressure_encode(double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        return Result<std::string>::failure(Error::INVALID_VALUE);
    }

    if (value == 0.0) {
        return Result<std::string>::success(
            "0000" + zero_padded(Protocol::Pressure::ZERO_EXPONENT + Protocol::Pressure::EXPONENT_BIAS, 2));
    }

    // "d.ddde+XX": rounding to 4 significant digits also handles 9.9996 -> 1.000e+01
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3e", value);
    const char* e = std::strchr(buf, 'e');
    if (e == nullptr || e - buf != 5) {
        return Result<std::string>::failure(Error::INVALID_VALUE);
    }

    int biased = static_cast<int>(std::strtol(e + 1, nullptr, 10)) + Protocol::Pressure::EXPONENT_BIAS;
    if (biased < 0 || biased > 99) {
        return Result<std::string>::failure(Error::INVALID_VALUE);
    }

    std::string code;
    code.reserve(Protocol::Pressure::CODE_DIGITS);
    code.push_back(buf[0]);
    code.append(buf + 2, 3);
    code += zero_padded(static_cast<unsigned long>(biased), 2);
    return Result<std::string>::success(code);
}

std::optional<double> pressure_decode(const std::string& code)
{
    if (code.size() != Protocol::Pressure::CODE_DIGITS || !is_digits(code)) {
        return std::nullopt;
    }

    int mantissa = std::stoi(code.substr(0, 4));
    int exponent = std::stoi(code.substr(4, 2));

    // mantissa carries three implied decimals
    int power = exponent - Protocol::Pressure::EXPONENT_BIAS - 3;
    if (power >= 0) {
        return mantissa * power_of_ten(power);
    }
    return mantissa / power_of_ten(-power);
}

Result<std::string> calibration_encode(double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        return Result<std::string>::failure(Error::INVALID_VALUE);
    }

    double scaled = std::nearbyint(value * Protocol::Calibration::SCALE);
    if (scaled > MAX_CALIBRATION_CODE) {
        return Result<std::string>::failure(Error::INVALID_VALUE);
    }
    return Result<std::string>::success(std::to_string(static_cast<unsigned long long>(scaled)));
}

std::optional<double> calibration_decode(const std::string& code)
{
    auto scaled = parse_unsigned(code);
    if (!scaled) {
        return std::nullopt;
    }
    return static_cast<double>(*scaled) / Protocol::Calibration::SCALE;
}

std::string zero_padded(unsigned long value, size_t width)
{
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(width)) << std::setfill('0') << value;
    return oss.str();
}

} // namespace vgauge
