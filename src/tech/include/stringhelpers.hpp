#pragma once

#include <charconv>
#include <concepts>
#include <string_view>
#include <system_error>

#include "fxr_config.hpp"
#include "fxr_invalid_argument_exception.hpp"

namespace fxr {

/// Parse an integral value from the whole given string.
/// Throws invalid_argument if the string is not a valid integral, or if it does not fit in Integral.
template <std::integral Integral>
Integral FromString(std::string_view str) {
  Integral ret{};
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), ret);
  if (FXR_UNLIKELY(errc != std::errc())) {
    if (errc == std::errc::result_out_of_range) {
      throw invalid_argument("'{}' would produce an out of range integral", str);
    }
    throw invalid_argument("Unable to decode '{}' into integral", str);
  }
  if (FXR_UNLIKELY(ptr != str.data() + str.size())) {
    throw invalid_argument("Unexpected trailing characters in integral '{}'", str);
  }
  return ret;
}

}  // namespace fxr
