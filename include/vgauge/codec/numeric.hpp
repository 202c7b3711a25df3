#pragma once

#include "common/types.hpp"
#include <optional>
#include <string>
#include <cstddef>

namespace vgauge {

// Decimal exponent of |value| in scientific notation; 0 for zero.
Result<int> exponent_of(double value);

// Decimal mantissa in [1, 10); 0 for zero.
Result<double> mantissa_of(double value);

/*
 * Pressure code: 4-digit mantissa (x1000) followed by the exponent biased
 * by 20. 1.23e-3 -> "123017", 0 -> "000019".
 */
Result<std::string> pressure_encode(double value);
std::optional<double> pressure_decode(const std::string& code);

// Calibration code: value x100 rounded half-to-even, no padding. 1.23 -> "123".
Result<std::string> calibration_encode(double value);
std::optional<double> calibration_decode(const std::string& code);

std::string zero_padded(unsigned long value, size_t width);

} // namespace vgauge
