#pragma once

#include <cstdint>
#include <optional>

#include "currencycode.hpp"
#include "decimal.hpp"
#include "peg-table.hpp"
#include "provider-descriptor.hpp"
#include "rate-table.hpp"
#include "reader.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {

namespace schema {
struct RatesSnapshot;
}

/// Converts amounts between currencies with the historical rates of a single provider.
///
/// Rates older than the requested date are accepted up to a look-back window (in days), to cope with days without
/// publication (week-ends, bank holidays).
/// Pairs of two currencies that are not the provider base currency are converted through it (cross rate).
///
/// Once constructed, it is immutable and all its methods can be called concurrently.
class FxConverter {
 public:
  static constexpr int32_t kDefaultLookbackDays = 7;

  /// Creates a FxConverter from already loaded tables.
  /// Throws invalid_argument if lookbackDays is negative.
  FxConverter(ProviderDescriptor provider, RateTable rates, PegTable pegs,
              int32_t lookbackDays = kDefaultLookbackDays);

  /// Creates a FxConverter from a rates snapshot in json format.
  /// A non empty bank id in the snapshot selects a well-known provider, and takes precedence over the provider part.
  FxConverter(const Reader &ratesSnapshotReader, int32_t lookbackDays = kDefaultLookbackDays);

  /// Get the rate such that 1 'from' = rate 'to' at given date.
  ResolutionResult rate(CurrencyCode from, CurrencyCode to, Date date) const;

  /// Convert 'amount' expressed in 'from' currency into 'to' currency at given date.
  /// Returns std::nullopt (and logs an error) if the rate cannot be resolved.
  std::optional<Decimal> convert(Decimal amount, CurrencyCode from, CurrencyCode to, Date date) const;

  /// Get the latest date for which a rate of given currency is stored, following its pegs if it has no rate itself.
  /// Returns std::nullopt if no dated rate is involved in its resolution (base currency, peg chain ending on the base
  /// currency, unknown currency).
  std::optional<Date> latestDate(CurrencyCode cur) const;

  /// Get the latest date at which both currencies of the pair have a published rate.
  /// A currency for which latestDate returns std::nullopt does not constrain the result.
  std::optional<Date> latestDate(CurrencyCode from, CurrencyCode to) const;

  ProviderDescriptor provider() const { return _provider; }

  const RateTable &rates() const { return _rates; }

  const PegTable &pegs() const { return _pegs; }

  int32_t lookbackDays() const { return _lookbackDays; }

 private:
  FxConverter(const schema::RatesSnapshot &ratesSnapshot, int32_t lookbackDays);

  ResolutionResult resolve(CurrencyCode from, CurrencyCode to, Date date) const;

  ProviderDescriptor _provider;
  RateTable _rates;
  PegTable _pegs;
  int32_t _lookbackDays;
};

}  // namespace fxr
