#include "rate-table.hpp"

#include <cstddef>
#include <optional>
#include <span>

#include "currencycode.hpp"
#include "datestring.hpp"
#include "decimal.hpp"
#include "exchange-rate.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "timedef.hpp"

namespace fxr {

RateTable::RateTable(std::span<const ExchangeRate> exchangeRates) {
  for (const ExchangeRate &exchangeRate : exchangeRates) {
    insert(exchangeRate);
  }
}

void RateTable::insert(CurrencyCode cur, Date date, Decimal rate) {
  if (!rate.isStrictlyPositive()) {
    throw invalid_argument("Invalid rate {} for {} on {}, it should be strictly positive", rate, cur,
                           DateToString(date));
  }
  auto [it, inserted] = _ratesByCurrency[cur].insert_or_assign(date, rate);
  if (!inserted) {
    log::debug("Replaced rate of {} on {} by {}", cur, DateToString(date), rate);
  }
}

const RateSeries *RateTable::find(CurrencyCode cur) const {
  const auto it = _ratesByCurrency.find(cur);
  return it == _ratesByCurrency.end() ? nullptr : &it->second;
}

std::optional<Decimal> RateTable::rate(CurrencyCode cur, Date date) const {
  const RateSeries *pRateSeries = find(cur);
  if (pRateSeries != nullptr) {
    const auto it = pRateSeries->find(date);
    if (it != pRateSeries->end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<Date> RateTable::latestDate(CurrencyCode cur) const {
  const RateSeries *pRateSeries = find(cur);
  if (pRateSeries == nullptr || pRateSeries->empty()) {
    return std::nullopt;
  }
  return pRateSeries->rbegin()->first;
}

std::size_t RateTable::nbRates() const noexcept {
  std::size_t nbRates = 0;
  for (const auto &[cur, rateSeries] : _ratesByCurrency) {
    nbRates += rateSeries.size();
  }
  return nbRates;
}

}  // namespace fxr
