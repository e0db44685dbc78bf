#include "rate-resolver.hpp"

#include <algorithm>
#include <iterator>

#include "currencycode.hpp"
#include "datestring.hpp"
#include "decimal.hpp"
#include "fxr_exception.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "fxr_smallvector.hpp"
#include "peg-table.hpp"
#include "provider-descriptor.hpp"
#include "rate-table.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"
#include "unreachable.hpp"

namespace fxr {
namespace {

class RateResolver {
 public:
  RateResolver(const RateTable &rates, const PegTable &pegs, Date date, Date minDate, ProviderDescriptor provider)
      : _rates(rates), _pegs(pegs), _date(date), _minDate(minDate), _provider(provider) {}

  ResolutionResult resolve(CurrencyCode from, CurrencyCode to) {
    if (from == to) {
      return ResolvedRate{Decimal(1), from};
    }

    const bool toIsBase = _provider.isBase(to);
    const CurrencyCode lookupCur = toIsBase ? from : to;
    const CurrencyCode anchorCur = toIsBase ? to : from;

    const RateSeries *pRateSeries = _rates.find(lookupCur);
    if (pRateSeries == nullptr) {
      return resolveThroughPeg(lookupCur, anchorCur, toIsBase);
    }
    return resolveDirect(*pRateSeries, from, to, lookupCur);
  }

 private:
  ResolutionResult resolveThroughPeg(CurrencyCode lookupCur, CurrencyCode anchorCur, bool toIsBase) {
    const auto optPeg = _pegs.find(lookupCur);
    if (!optPeg) {
      return ResolutionError(ResolutionError::Type::kUnsupportedCurrency, lookupCur);
    }
    if (std::ranges::find(_pegChain, lookupCur) != _pegChain.end()) {
      log::debug("Peg chain of {} comes back to {}", _pegChain.front(), lookupCur);
      return ResolutionError(ResolutionError::Type::kCircularPeg, lookupCur);
    }

    log::trace("{} is pegged to {} at {}", lookupCur, optPeg->peggedTo, optPeg->rate);

    _pegChain.push_back(lookupCur);
    ResolutionResult pegResult = resolve(anchorCur, optPeg->peggedTo);
    _pegChain.pop_back();

    if (!pegResult) {
      return pegResult;
    }

    const Decimal pegRate = pegResult.rate();
    return ResolvedRate{toIsBase ? optPeg->rate / pegRate : pegRate / optPeg->rate, lookupCur};
  }

  ResolutionResult resolveDirect(const RateSeries &rateSeries, CurrencyCode from, CurrencyCode to,
                                 CurrencyCode lookupCur) const {
    const bool toIsBase = _provider.isBase(to);
    if (!toIsBase && !_provider.isBase(from)) {
      log::critical("Cannot classify rate {} -> {}, none of them is the base currency of provider {}", from, to,
                    _provider);
      throw exception("Neither {} nor {} is the base currency of provider {}", from, to, _provider);
    }

    // latest published rate at or before requested date
    auto it = rateSeries.upper_bound(_date);
    if (it == rateSeries.begin() || std::prev(it)->first < _minDate) {
      log::debug("No rate for {} between {} and {}", lookupCur, DateToString(_minDate), DateToString(_date));
      return ResolutionError(ResolutionError::Type::kNoRateFound, lookupCur);
    }
    --it;

    const auto [rateDate, storedRate] = *it;
    if (rateDate != _date) {
      log::debug("Using rate of {} from {} for {}", lookupCur, DateToString(rateDate), DateToString(_date));
    }

    switch (_provider.quoteConvention()) {
      case QuoteConvention::direct:
        return ResolvedRate{toIsBase ? storedRate : storedRate.inverse(), lookupCur};
      case QuoteConvention::indirect:
        return ResolvedRate{toIsBase ? storedRate.inverse() : storedRate, lookupCur};
      default:
        unreachable();
    }
  }

  const RateTable &_rates;
  const PegTable &_pegs;
  Date _date;
  Date _minDate;
  ProviderDescriptor _provider;
  SmallVector<CurrencyCode, 4> _pegChain;
};

}  // namespace

ResolutionResult ResolveRate(const RateTable &rates, const PegTable &pegs, Date date, Date minDate,
                             ProviderDescriptor provider, CurrencyCode from, CurrencyCode to) {
  if (minDate > date) {
    throw invalid_argument("Invalid date window [{}, {}]", DateToString(minDate), DateToString(date));
  }
  return RateResolver(rates, pegs, date, minDate, provider).resolve(from, to);
}

}  // namespace fxr
