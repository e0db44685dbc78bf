#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "currencycode.hpp"
#include "decimal.hpp"
#include "fxr_format.hpp"

namespace fxr {

/// A successfully resolved conversion rate.
struct ResolvedRate {
  bool operator==(const ResolvedRate &) const noexcept = default;

  Decimal rate;
  CurrencyCode lookupCurrency;  // non base currency of the pair actually looked up, for diagnostics
};

/// Expected failure of a rate resolution. It is returned as a value, never thrown.
class ResolutionError {
 public:
  enum class Type : int8_t {
    kUnsupportedCurrency,  // currency has neither a rate series nor a peg
    kNoRateFound,          // currency has a rate series, but no rate in the requested date window
    kCircularPeg           // peg chain comes back to a currency already being resolved
  };

  constexpr ResolutionError(Type type, CurrencyCode currency) noexcept : _currency(currency), _type(type) {}

  constexpr Type type() const noexcept { return _type; }

  constexpr CurrencyCode currency() const noexcept { return _currency; }

  std::string str() const;

  constexpr bool operator==(const ResolutionError &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const ResolutionError &error) { return os << error.str(); }

 private:
  CurrencyCode _currency;
  Type _type;
};

std::string_view ResolutionErrorTypeStr(ResolutionError::Type type);

/// Result of a rate resolution: either a resolved rate or a typed error.
class ResolutionResult {
 public:
  ResolutionResult(ResolvedRate resolvedRate) noexcept : _value(resolvedRate) {}

  ResolutionResult(ResolutionError error) noexcept : _value(error) {}

  bool isOk() const noexcept { return std::holds_alternative<ResolvedRate>(_value); }

  explicit operator bool() const noexcept { return isOk(); }

  /// Get the resolved rate. Throws std::bad_variant_access if this result is an error.
  const ResolvedRate &resolvedRate() const { return std::get<ResolvedRate>(_value); }

  Decimal rate() const { return resolvedRate().rate; }

  CurrencyCode lookupCurrency() const { return resolvedRate().lookupCurrency; }

  /// Get the error. Throws std::bad_variant_access if this result is a resolved rate.
  const ResolutionError &error() const { return std::get<ResolutionError>(_value); }

  bool operator==(const ResolutionResult &) const noexcept = default;

 private:
  std::variant<ResolvedRate, ResolutionError> _value;
};

}  // namespace fxr

template <>
struct fmt::formatter<fxr::ResolutionError> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxr::ResolutionError &error, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{} {}", fxr::ResolutionErrorTypeStr(error.type()), error.currency());
  }
};
