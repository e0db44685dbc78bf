#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include "currencycode.hpp"
#include "fxr_format.hpp"
#include "fxr_json.hpp"

namespace fxr {

/// How a provider publishes its rates relative to its own base currency.
enum class QuoteConvention : int8_t {
  direct,   // 1 unit of base currency = X units of other currency
  indirect  // 1 unit of other currency = X units of base currency
};

std::string_view QuoteConventionStr(QuoteConvention quoteConvention);

/// Describes the source of a rate table: its base currency and its quote convention.
/// It is immutable once constructed.
class ProviderDescriptor {
 public:
  constexpr ProviderDescriptor(CurrencyCode baseCurrency, QuoteConvention quoteConvention) noexcept
      : _baseCurrency(baseCurrency), _quoteConvention(quoteConvention) {}

  constexpr CurrencyCode baseCurrency() const noexcept { return _baseCurrency; }

  constexpr QuoteConvention quoteConvention() const noexcept { return _quoteConvention; }

  constexpr bool isBase(CurrencyCode cur) const noexcept { return cur == _baseCurrency; }

  constexpr bool operator==(const ProviderDescriptor &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const ProviderDescriptor &provider);

 private:
  CurrencyCode _baseCurrency;
  QuoteConvention _quoteConvention;
};

/// Get the descriptor of a well-known provider from its bank identifier.
/// Throws invalid_argument if the bank identifier is unknown.
ProviderDescriptor ProviderDescriptorFromBankId(std::string_view bankId);

}  // namespace fxr

template <>
struct glz::meta<fxr::QuoteConvention> {
  using enum fxr::QuoteConvention;

  static constexpr auto value = enumerate(direct, indirect);
};

template <>
struct fmt::formatter<fxr::ProviderDescriptor> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxr::ProviderDescriptor &provider, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{} ({})", provider.baseCurrency(),
                          fxr::QuoteConventionStr(provider.quoteConvention()));
  }
};
