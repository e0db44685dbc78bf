#pragma once

#include "currencycode.hpp"
#include "peg-table.hpp"
#include "provider-descriptor.hpp"
#include "rate-table.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {

/// Resolve the conversion rate from 'from' to 'to' (1 'from' = rate 'to') with the rates published by 'provider'.
///
/// The currency looked up in 'rates' is the one of the pair which is not the provider base currency.
/// The latest rate published in [minDate, date] is taken, and inverted or not depending on the provider quote
/// convention. Currencies without rates are resolved through their peg, recursively.
///
/// Expected failures (unsupported currency, no rate in the date window, circular peg) are returned as a
/// ResolutionError. Exceptions are only raised for invalid calls:
///  - invalid_argument if minDate > date
///  - exception if a rate needs to be classified while none of the currencies of the pair is the provider base
///
/// It does not modify any of its inputs and can be called concurrently.
ResolutionResult ResolveRate(const RateTable &rates, const PegTable &pegs, Date date, Date minDate,
                             ProviderDescriptor provider, CurrencyCode from, CurrencyCode to);

}  // namespace fxr
