#pragma once

#include <map>
#include <string>

#include "provider-descriptor.hpp"
#include "reader.hpp"

namespace fxr {

namespace schema {

struct RatesSnapshotProvider {
  std::string base;
  QuoteConvention quoteConvention{QuoteConvention::indirect};
};

struct RatesSnapshotPeg {
  std::string peggedTo;
  std::string rate;
};

/// Rates are stored as strings to keep their exact decimal representation.
using RatesSnapshotSeries = std::map<std::string, std::string, std::less<>>;

/// Already fetched rates of one provider, with the pegs known for it.
struct RatesSnapshot {
  std::string bankId;
  RatesSnapshotProvider provider;
  std::map<std::string, RatesSnapshotSeries, std::less<>> rates;
  std::map<std::string, RatesSnapshotPeg, std::less<>> pegs;
};

}  // namespace schema

/// Reads a rates snapshot, rejecting unknown keys.
schema::RatesSnapshot ReadRatesSnapshot(const Reader &reader);

}  // namespace fxr
