#include "decimal.hpp"

#include <algorithm>
#include <charconv>
#include <compare>
#include <cstdint>
#include <limits>
#include <ranges>
#include <string_view>
#include <system_error>
#include <utility>

#include "fxr_config.hpp"
#include "fxr_exception.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "ipow.hpp"
#include "ndigits.hpp"

namespace fxr {
namespace {

constexpr Decimal::AmountType kMaxParsedAmount = ipow10(Decimal::kMaxNbDigits) - 1;

constexpr void RemovePrefixSpaces(std::string_view &str) {
  const auto firstNonSpaceIt = std::ranges::find_if(str, [](char ch) { return ch != ' '; });
  str.remove_prefix(static_cast<std::string_view::size_type>(firstNonSpaceIt - str.begin()));
}

constexpr void RemoveTrailingSpaces(std::string_view &str) {
  str.remove_suffix(static_cast<std::string_view::size_type>(
      std::ranges::find_if(std::ranges::reverse_view(str), [](char ch) { return ch != ' '; }) -
      std::ranges::rbegin(str)));
}

int ParseSign(std::string_view &amountStr) {
  int negMult = 1;
  if (!amountStr.empty()) {
    switch (amountStr.front()) {
      case '-':
        negMult = -1;
        [[fallthrough]];
      case '+':  // Let's accept inputs like: "+3" -> "3"
        amountStr.remove_prefix(1UL);
        break;
      default:
        break;
    }
  }
  return negMult;
}

int ParseExponent(std::string_view exponentStr, std::string_view amountStr) {
  if (!exponentStr.empty() && exponentStr.front() == '+') {
    exponentStr.remove_prefix(1UL);
  }
  int exponent{};
  const auto [ptr, errc] = std::from_chars(exponentStr.data(), exponentStr.data() + exponentStr.size(), exponent);
  if (errc != std::errc() || ptr != exponentStr.data() + exponentStr.size()) {
    throw invalid_argument("Invalid exponent in decimal string '{}'", amountStr);
  }
  return exponent;
}

/// Converts a string into a fixed precision integral containing both the integer and decimal part.
/// Should be called after ParseSign because no + / - sign is expected at the start of the string.
std::pair<Decimal::AmountType, int> AmountIntegralFromStr(std::string_view amountStr) {
  const auto amountStrSz = amountStr.size();

  std::size_t dotPos = std::string_view::npos;
  Decimal::AmountType integralValue = 0;
  int nbDecimals = 0;
  int nbDigits = 0;

  std::size_t charPos;

  // Manual parsing to make a single integral conversion while skipping a possible dot.
  for (charPos = 0; charPos < amountStrSz; ++charPos) {
    const char ch = amountStr[charPos];
    if (ch == '.') {
      if (dotPos != std::string_view::npos) {
        throw invalid_argument("Decimal string '{}' with multiple dots", amountStr);
      }
      dotPos = charPos;
      continue;
    }
    if (ch == 'E' || ch == 'e') {
      // scientific notation, the exponent is the end of the string
      nbDecimals -= ParseExponent(amountStr.substr(charPos + 1), amountStr);
      break;
    }
    if (ch < '0' || ch > '9') {
      throw invalid_argument("Decimal string '{}' with invalid character '{}'", amountStr, ch);
    }

    ++nbDigits;
    const int intDigit = ch - '0';

    if (integralValue > (kMaxParsedAmount - intDigit) / 10) {
      // we will overflow if we add this digit.
      //  - either we are parsing decimals, in this case we can just drop the remaining ones.
      //  - there are no decimals, in this case we should throw an exception.
      if (dotPos == std::string_view::npos) {
        throw exception("Decimal string '{}' integral part is too big", amountStr);
      }

      // continue instead of break to ensure we don't forget about scientific notation
      --nbDecimals;
      continue;
    }

    integralValue = integralValue * 10 + intDigit;
  }

  if (nbDigits == 0) {
    throw invalid_argument("Decimal string '{}' does not contain any digit", amountStr);
  }

  // At this point, charPos points to the end of the amount string, but before the scientific notation if it exists.
  if (dotPos != std::string_view::npos) {
    nbDecimals += static_cast<int>(charPos - dotPos - 1);
  }

  if (nbDecimals < 0) {
    if (integralValue != 0) {
      if (-nbDecimals >= Decimal::kMaxNbDigits ||
          integralValue > kMaxParsedAmount / ipow10(static_cast<uint8_t>(-nbDecimals))) {
        throw exception("Decimal string '{}' integral part is too big", amountStr);
      }
      integralValue *= ipow10(static_cast<uint8_t>(-nbDecimals));
    }
    nbDecimals = 0;
  }

  return {integralValue, nbDecimals};
}

constexpr auto SafeConvertSameDecimals(Decimal::AmountType &lhsAmount, Decimal::AmountType &rhsAmount,
                                       int8_t lhsNbDecimals, int8_t rhsNbDecimals) {
  int lhsNbDigits = ndigits(lhsAmount);
  int rhsNbDigits = ndigits(rhsAmount);
  while (lhsNbDecimals != rhsNbDecimals) {
    if (lhsNbDecimals < rhsNbDecimals) {
      if (lhsNbDigits < Decimal::kMaxNbDigits) {
        ++lhsNbDecimals;
        ++lhsNbDigits;
        lhsAmount *= 10;
      } else {
        --rhsNbDecimals;
        --rhsNbDigits;
        rhsAmount /= 10;
      }
    } else {
      if (rhsNbDigits < Decimal::kMaxNbDigits) {
        ++rhsNbDecimals;
        ++rhsNbDigits;
        rhsAmount *= 10;
      } else {
        --lhsNbDecimals;
        --lhsNbDigits;
        lhsAmount /= 10;
      }
    }
  }
  return lhsNbDecimals;
}

}  // namespace

Decimal::Decimal(std::string_view amountStr) {
  RemovePrefixSpaces(amountStr);
  RemoveTrailingSpaces(amountStr);
  const std::string_view fullAmountStr = amountStr;
  const int negMult = ParseSign(amountStr);
  const auto [amountInt, nbDecimals] = AmountIntegralFromStr(amountStr);
  _amount = amountInt * negMult;
  if (nbDecimals > std::numeric_limits<int8_t>::max()) {
    _amount = 0;
    _nbDecimals = 0;
  } else {
    sanitize(static_cast<int8_t>(nbDecimals));
  }
  if (amountInt != 0 && _amount == 0) {
    // all significant digits are beyond our precision
    throw invalid_argument("Decimal string '{}' is too small, at most {} decimals are supported", fullAmountStr,
                           kMaxNbDecimals);
  }
}

std::strong_ordering Decimal::operator<=>(const Decimal &other) const {
  const auto lhsNbDecimals = _nbDecimals;
  const auto rhsNbDecimals = other._nbDecimals;
  if (lhsNbDecimals == rhsNbDecimals) {
    return _amount <=> other._amount;
  }
  const auto lhsIntAmount = integerPart();
  const auto rhsIntAmount = other.integerPart();
  if (lhsIntAmount != rhsIntAmount) {
    return lhsIntAmount <=> rhsIntAmount;
  }
  // Same integral part, so expanding one's number of decimals towards the other one is safe
  AmountType lhsAmount = _amount;
  AmountType rhsAmount = other._amount;
  for (int8_t nbD = lhsNbDecimals; nbD < rhsNbDecimals; ++nbD) {
    lhsAmount *= 10;
  }
  for (int8_t nbD = rhsNbDecimals; nbD < lhsNbDecimals; ++nbD) {
    rhsAmount *= 10;
  }
  return lhsAmount <=> rhsAmount;
}

Decimal Decimal::operator+(Decimal other) const {
  auto lhsAmount = _amount;
  auto rhsAmount = other._amount;
  int8_t resNbDecimals = SafeConvertSameDecimals(lhsAmount, rhsAmount, _nbDecimals, other._nbDecimals);
  AmountType resAmount = lhsAmount + rhsAmount;
  if (resAmount >= kMaxAmountFullNDigits || resAmount <= -kMaxAmountFullNDigits) {
    if (resNbDecimals == 0) {
      throw exception("Overflow during addition {} + {}", *this, other);
    }
    resAmount /= 10;
    --resNbDecimals;
  }
  return {resAmount, resNbDecimals};
}

Decimal Decimal::operator*(Decimal mult) const {
  AmountType lhsAmount = _amount;
  AmountType rhsAmount = mult._amount;
  int8_t lhsNbDecimals = _nbDecimals;
  int8_t rhsNbDecimals = mult._nbDecimals;
  int lhsNbDigits = ndigits(lhsAmount);
  int rhsNbDigits = ndigits(rhsAmount);

  if (lhsNbDigits + rhsNbDigits > kMaxNbDigits) {
    log::trace("Reaching precision limits of Decimal for {} * {}, truncating", *this, mult);
  }
  while (lhsNbDigits + rhsNbDigits > kMaxNbDigits) {
    // We need to truncate, choose the Decimal with the highest number of decimals in priority
    if (rhsNbDecimals == 0 && lhsNbDecimals == 0) {
      throw exception("Overflow during multiplication {} * {}", *this, mult);
    }
    if (rhsNbDecimals == 0 || (lhsNbDecimals != 0 && (lhsAmount % 10 == 0 || rhsNbDecimals < lhsNbDecimals))) {
      // Truncate from Lhs
      --lhsNbDecimals;
      --lhsNbDigits;
      lhsAmount /= 10;
    } else {
      // Truncate from Rhs
      --rhsNbDecimals;
      --rhsNbDigits;
      rhsAmount /= 10;
    }
  }
  return {lhsAmount * rhsAmount, static_cast<int8_t>(lhsNbDecimals + rhsNbDecimals)};
}

Decimal Decimal::operator/(Decimal div) const {
  if (FXR_UNLIKELY(div._amount == 0)) {
    throw invalid_argument("Division of {} by zero", *this);
  }
  if (_amount == 0) {
    return {};
  }

  using UnsignedAmountType = uint64_t;

  const int negMult = (_amount < 0) != (div._amount < 0) ? -1 : 1;

  // Switch to an unsigned temporarily to ensure that lhs > rhs before the divide.
  // Indeed, on 64 bits the unsigned integral type can hold one more digit than its signed counterpart.
  static constexpr int kMaxUnsignedNbDigits = std::numeric_limits<UnsignedAmountType>::digits10;
  static_assert(kMaxUnsignedNbDigits > kMaxNbDigits);

  const int lhsNbDigitsToAdd = kMaxUnsignedNbDigits - ndigits(_amount);
  auto lhs = static_cast<UnsignedAmountType>(_amount < 0 ? -_amount : _amount) *
             static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(lhsNbDigitsToAdd)));
  const auto rhs = static_cast<UnsignedAmountType>(div._amount < 0 ? -div._amount : div._amount);

  UnsignedAmountType totalIntPart = 0;
  int nbDecs = _nbDecimals + lhsNbDigitsToAdd - div._nbDecimals;
  int totalPartNbDigits;

  while (true) {
    totalIntPart += lhs / rhs;  // Add integral part
    totalPartNbDigits = ndigits(totalIntPart);
    lhs %= rhs;  // Keep the rest
    if (lhs == 0) {
      break;
    }
    const int nbDigitsToAdd = kMaxUnsignedNbDigits - std::max(totalPartNbDigits, ndigits(lhs));
    if (nbDigitsToAdd <= 0) {
      break;
    }
    const auto multPower = static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDigitsToAdd)));
    totalIntPart *= multPower;
    lhs *= multPower;
    nbDecs += nbDigitsToAdd;
  }

  if (nbDecs < 0) {
    if (kMaxNbDigits < totalPartNbDigits - nbDecs) {
      throw exception("Overflow during divide {} / {}", *this, div);
    }
    totalIntPart *= static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(-nbDecs)));
    nbDecs = 0;
  } else {
    const int nbDigitsTruncate = totalPartNbDigits - kMaxNbDigits;
    if (nbDigitsTruncate > 0) {
      if (nbDecs < nbDigitsTruncate) {
        throw exception("Overflow during divide {} / {}", *this, div);
      }
      totalIntPart /= static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDigitsTruncate)));
      nbDecs -= nbDigitsTruncate;
    }
  }

  // Drop decimals that cannot be represented before narrowing the number of decimals to 8 bits
  for (; nbDecs > kMaxNbDecimals; --nbDecs) {
    totalIntPart /= 10U;
  }

  return {static_cast<AmountType>(totalIntPart) * negMult, static_cast<int8_t>(nbDecs)};
}

}  // namespace fxr
