#include "fx-converter.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>

#include "currencycode.hpp"
#include "datestring.hpp"
#include "decimal.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "fxr_smallvector.hpp"
#include "peg-table.hpp"
#include "provider-descriptor.hpp"
#include "rate-resolver.hpp"
#include "rate-table.hpp"
#include "rates-snapshot.hpp"
#include "reader.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {
namespace {

ProviderDescriptor ProviderFromSnapshot(const schema::RatesSnapshot &ratesSnapshot) {
  if (!ratesSnapshot.bankId.empty()) {
    return ProviderDescriptorFromBankId(ratesSnapshot.bankId);
  }
  if (ratesSnapshot.provider.base.empty()) {
    throw invalid_argument("Rates snapshot should define either a bank id or a provider base currency");
  }
  return {CurrencyCode(ratesSnapshot.provider.base), ratesSnapshot.provider.quoteConvention};
}

RateTable RatesFromSnapshot(const schema::RatesSnapshot &ratesSnapshot) {
  RateTable rates;
  for (const auto &[curStr, rateSeries] : ratesSnapshot.rates) {
    const CurrencyCode cur(curStr);
    for (const auto &[dateStr, rateStr] : rateSeries) {
      rates.insert(cur, StringToDate(dateStr), Decimal(rateStr));
    }
  }
  return rates;
}

PegTable PegsFromSnapshot(const schema::RatesSnapshot &ratesSnapshot) {
  PegTable pegs;
  for (const auto &[curStr, peg] : ratesSnapshot.pegs) {
    pegs.insert(CurrencyCode(curStr), Peg{CurrencyCode(peg.peggedTo), Decimal(peg.rate)});
  }
  return pegs;
}

}  // namespace

FxConverter::FxConverter(ProviderDescriptor provider, RateTable rates, PegTable pegs, int32_t lookbackDays)
    : _provider(provider), _rates(std::move(rates)), _pegs(std::move(pegs)), _lookbackDays(lookbackDays) {
  if (_lookbackDays < 0) {
    throw invalid_argument("Look-back window should be non negative, got {} days", _lookbackDays);
  }
  if (_rates.contains(_provider.baseCurrency())) {
    log::warn("Rates of base currency {} will never be used", _provider.baseCurrency());
  }
  log::debug("FxConverter for {} with {} rates of {} currencies and {} pegs, look-back of {} days", _provider,
             _rates.nbRates(), _rates.size(), _pegs.size(), _lookbackDays);
}

FxConverter::FxConverter(const Reader &ratesSnapshotReader, int32_t lookbackDays)
    : FxConverter(ReadRatesSnapshot(ratesSnapshotReader), lookbackDays) {}

FxConverter::FxConverter(const schema::RatesSnapshot &ratesSnapshot, int32_t lookbackDays)
    : FxConverter(ProviderFromSnapshot(ratesSnapshot), RatesFromSnapshot(ratesSnapshot),
                  PegsFromSnapshot(ratesSnapshot), lookbackDays) {}

ResolutionResult FxConverter::resolve(CurrencyCode from, CurrencyCode to, Date date) const {
  return ResolveRate(_rates, _pegs, date, date - days(_lookbackDays), _provider, from, to);
}

ResolutionResult FxConverter::rate(CurrencyCode from, CurrencyCode to, Date date) const {
  const CurrencyCode base = _provider.baseCurrency();
  if (from == to || from == base || to == base) {
    return resolve(from, to, date);
  }

  // cross rate through the provider base currency
  ResolutionResult fromBase = resolve(from, base, date);
  if (!fromBase) {
    return fromBase;
  }
  ResolutionResult baseTo = resolve(base, to, date);
  if (!baseTo) {
    return baseTo;
  }

  log::trace("Cross rate {} -> {} through {}", from, to, base);
  return ResolvedRate{fromBase.rate() * baseTo.rate(), baseTo.lookupCurrency()};
}

std::optional<Decimal> FxConverter::convert(Decimal amount, CurrencyCode from, CurrencyCode to, Date date) const {
  const ResolutionResult res = rate(from, to, date);
  if (!res) {
    log::error("Unable to convert {} {} into {} on {}: {}", amount, from, to, DateToString(date), res.error());
    return std::nullopt;
  }
  return amount * res.rate();
}

std::optional<Date> FxConverter::latestDate(CurrencyCode cur) const {
  SmallVector<CurrencyCode, 4> visitedCurrencies;
  while (!_provider.isBase(cur)) {
    const auto optDate = _rates.latestDate(cur);
    if (optDate) {
      return optDate;
    }
    const auto optPeg = _pegs.find(cur);
    if (!optPeg || std::ranges::find(visitedCurrencies, cur) != visitedCurrencies.end()) {
      break;
    }
    visitedCurrencies.push_back(cur);
    cur = optPeg->peggedTo;
  }
  return std::nullopt;
}

std::optional<Date> FxConverter::latestDate(CurrencyCode from, CurrencyCode to) const {
  const auto fromDate = latestDate(from);
  const auto toDate = latestDate(to);
  if (fromDate && toDate) {
    return std::min(*fromDate, *toDate);
  }
  return fromDate ? fromDate : toDate;
}

}  // namespace fxr
