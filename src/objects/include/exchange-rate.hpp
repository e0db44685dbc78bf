#pragma once

#include "currencycode.hpp"
#include "decimal.hpp"
#include "timedef.hpp"

namespace fxr {

/// A single rate publication of a provider: on 'date', the rate of 'currency' relative to the provider base currency
/// was 'rate' (its direction depends on the provider quote convention).
struct ExchangeRate {
  bool operator==(const ExchangeRate &) const noexcept = default;

  CurrencyCode currency;
  Date date;
  Decimal rate;
};

}  // namespace fxr
