#include "resolution-result.hpp"

#include <string>
#include <string_view>

#include "fxr_format.hpp"
#include "unreachable.hpp"

namespace fxr {

std::string_view ResolutionErrorTypeStr(ResolutionError::Type type) {
  switch (type) {
    case ResolutionError::Type::kUnsupportedCurrency:
      return "unsupported currency";
    case ResolutionError::Type::kNoRateFound:
      return "no rate found for";
    case ResolutionError::Type::kCircularPeg:
      return "circular peg on";
    default:
      unreachable();
  }
}

std::string ResolutionError::str() const { return format("{}", *this); }

}  // namespace fxr
