#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>

#include "currencycode.hpp"
#include "decimal.hpp"

namespace fxr {

/// Fixed rate relationship: 1 unit of the pegged currency equals 'rate' units of 'peggedTo'.
struct Peg {
  bool operator==(const Peg &) const noexcept = default;

  CurrencyCode peggedTo;
  Decimal rate;
};

/// Pegs by pegged currency.
class PegTable {
 public:
  using PegByCurrency = std::unordered_map<CurrencyCode, Peg>;
  using const_iterator = PegByCurrency::const_iterator;

  /// Declare 'cur' as pegged to 'peg.peggedTo'. An existing peg for 'cur' is replaced.
  /// Throws invalid_argument if the peg rate is not strictly positive or if the currency is pegged to itself.
  void insert(CurrencyCode cur, Peg peg);

  std::optional<Peg> find(CurrencyCode cur) const;

  bool contains(CurrencyCode cur) const { return _pegs.contains(cur); }

  const_iterator begin() const noexcept { return _pegs.begin(); }
  const_iterator end() const noexcept { return _pegs.end(); }

  std::size_t size() const noexcept { return _pegs.size(); }

  bool empty() const noexcept { return _pegs.empty(); }

 private:
  PegByCurrency _pegs;
};

}  // namespace fxr
