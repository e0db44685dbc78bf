#pragma once

#include <concepts>

namespace fxr {

/// Return the number of digits of given integral.
/// The minus sign is not counted. 0 has 1 digit.
constexpr int ndigits(std::unsigned_integral auto n) noexcept {
  int nbDigits = 1;
  for (; n >= 10U; n /= 10U) {
    ++nbDigits;
  }
  return nbDigits;
}

constexpr int ndigits(std::signed_integral auto n) noexcept {
  int nbDigits = 1;
  // Division towards zero keeps the sign, no need to take the absolute value (which would overflow for min())
  for (; n >= 10 || n <= -10; n /= 10) {
    ++nbDigits;
  }
  return nbDigits;
}

}  // namespace fxr
