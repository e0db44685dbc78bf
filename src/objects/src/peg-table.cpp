#include "peg-table.hpp"

#include <optional>

#include "currencycode.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"

namespace fxr {

void PegTable::insert(CurrencyCode cur, Peg peg) {
  if (!peg.rate.isStrictlyPositive()) {
    throw invalid_argument("Invalid peg rate {} for {}, it should be strictly positive", peg.rate, cur);
  }
  if (cur == peg.peggedTo) {
    throw invalid_argument("{} cannot be pegged to itself", cur);
  }
  auto [it, inserted] = _pegs.insert_or_assign(cur, peg);
  if (!inserted) {
    log::debug("Replaced peg of {} by {} {}", cur, peg.rate, peg.peggedTo);
  }
}

std::optional<Peg> PegTable::find(CurrencyCode cur) const {
  const auto it = _pegs.find(cur);
  if (it == _pegs.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace fxr
