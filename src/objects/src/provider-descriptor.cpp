#include "provider-descriptor.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <string_view>

#include "currencycode.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "unreachable.hpp"

namespace fxr {
namespace {

struct KnownProvider {
  std::string_view bankId;
  ProviderDescriptor provider;
};

constexpr KnownProvider kKnownProviders[] = {
    {"EUECB", ProviderDescriptor(CurrencyCode("EUR"), QuoteConvention::indirect)},  // European Central Bank
    {"MXCB", ProviderDescriptor(CurrencyCode("MXN"), QuoteConvention::direct)},     // Banco de Mexico
};

}  // namespace

std::string_view QuoteConventionStr(QuoteConvention quoteConvention) {
  switch (quoteConvention) {
    case QuoteConvention::direct:
      return "direct";
    case QuoteConvention::indirect:
      return "indirect";
    default:
      unreachable();
  }
}

std::ostream &operator<<(std::ostream &os, const ProviderDescriptor &provider) {
  return os << provider.baseCurrency() << " (" << QuoteConventionStr(provider.quoteConvention()) << ')';
}

ProviderDescriptor ProviderDescriptorFromBankId(std::string_view bankId) {
  const auto it = std::ranges::find_if(kKnownProviders, [bankId](const KnownProvider &knownProvider) {
    return knownProvider.bankId == bankId;
  });
  if (it == std::end(kKnownProviders)) {
    throw invalid_argument("Unknown bank id '{}', known ones are EUECB|MXCB", bankId);
  }
  return it->provider;
}

}  // namespace fxr
