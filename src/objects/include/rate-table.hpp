#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <unordered_map>

#include "currencycode.hpp"
#include "decimal.hpp"
#include "exchange-rate.hpp"
#include "timedef.hpp"

namespace fxr {

/// Rates of a single currency, sorted by date.
using RateSeries = std::map<Date, Decimal>;

/// Historical rates published by a provider, by currency and by date.
/// Rates are expressed relative to the provider base currency, which is never a key of this table.
class RateTable {
 public:
  using RateSeriesByCurrency = std::unordered_map<CurrencyCode, RateSeries>;
  using const_iterator = RateSeriesByCurrency::const_iterator;

  RateTable() = default;

  explicit RateTable(std::span<const ExchangeRate> exchangeRates);

  /// Insert a rate for given currency and date.
  /// If a rate already exists for this currency and date, it is replaced by the new one.
  /// Throws invalid_argument if rate is not strictly positive.
  void insert(CurrencyCode cur, Date date, Decimal rate);

  void insert(const ExchangeRate &exchangeRate) { insert(exchangeRate.currency, exchangeRate.date, exchangeRate.rate); }

  /// Get a pointer to the rate series of given currency, or nullptr if currency has no rate.
  const RateSeries *find(CurrencyCode cur) const;

  bool contains(CurrencyCode cur) const { return _ratesByCurrency.contains(cur); }

  /// Get the rate stored exactly at given date for given currency, if any.
  std::optional<Decimal> rate(CurrencyCode cur, Date date) const;

  /// Get the latest date for which a rate of given currency is stored, if any.
  std::optional<Date> latestDate(CurrencyCode cur) const;

  const_iterator begin() const noexcept { return _ratesByCurrency.begin(); }
  const_iterator end() const noexcept { return _ratesByCurrency.end(); }

  /// Number of currencies having at least one rate.
  std::size_t size() const noexcept { return _ratesByCurrency.size(); }

  bool empty() const noexcept { return _ratesByCurrency.empty(); }

  /// Total number of rates, all currencies included.
  std::size_t nbRates() const noexcept;

 private:
  RateSeriesByCurrency _ratesByCurrency;
};

}  // namespace fxr
