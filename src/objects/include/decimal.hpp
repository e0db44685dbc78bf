#pragma once

#include <algorithm>
#include <charconv>
#include <compare>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "fxr_format.hpp"
#include "ipow.hpp"
#include "ndigits.hpp"

namespace fxr {

/// Represents a signed fixed-precision decimal number, used for exchange rates and amounts.
/// It is designed to be
///  - small (16 bytes only). Thus can be passed by copy instead of reference (it is trivially copyable)
///  - precise (amount is stored in a int64_t, no binary floating point is involved in any operation)
///  - exact for additions, subtractions and comparisons (if no overflow during the operation)
///  - deterministic for products and quotients, which are truncated to the 18 available digits
///
/// The integral value stored is multiplied by 10^'_nbDecimals'.
/// Its number of decimals is automatically adjusted and simplified (no trailing zeros are kept), so that each number
/// has a unique representation.
///
/// It can hold up to 18 significant digits, and up to 17 decimals.
/// Examples: 1.0856, -0.00042, 17.5
class Decimal {
 public:
  using AmountType = int64_t;

  static constexpr int8_t kMaxNbDigits = std::numeric_limits<AmountType>::digits10;
  static constexpr int8_t kMaxNbDecimals = kMaxNbDigits - 1;  // -1 as minimal nb digits of integral part

  /// Constructs a Decimal with a value of 0.
  constexpr Decimal() noexcept = default;

  /// Constructs a Decimal representing the integer 'amount'.
  constexpr explicit Decimal(std::integral auto amount) noexcept : _amount(static_cast<AmountType>(amount)) {
    sanitize(0);
  }

  /// Constructs a new Decimal from an integral representation which is already multiplied by given number of decimals.
  /// Example: Decimal(10856, 4) is 1.0856
  constexpr Decimal(AmountType amount, int8_t nbDecimals) noexcept : _amount(amount) { sanitize(nbDecimals); }

  /// Constructs a new Decimal from its string representation.
  /// Accepted inputs are optionally signed decimal numbers, with an optional exponent part.
  /// Examples: "1.0856", "-3", "+.5", "2.5e-3", "17.50"
  /// Decimals that do not fit are truncated, an exception is raised if the integral part is too big or if a non zero
  /// input has no significant digit within the supported decimals.
  explicit Decimal(std::string_view amountStr);

  /// Get the integral representation of this Decimal multiplied by 10^nbDecimals().
  /// Example: "5.6235" will return 56235
  [[nodiscard]] constexpr AmountType amount() const noexcept { return _amount; }

  [[nodiscard]] constexpr int8_t nbDecimals() const noexcept { return _nbDecimals; }

  /// Get the integer part of this Decimal.
  [[nodiscard]] constexpr AmountType integerPart() const noexcept {
    return _amount / ipow10(static_cast<uint8_t>(_nbDecimals));
  }

  /// Get the amount of this Decimal in double format. Only meant for display or approximate comparisons.
  [[nodiscard]] constexpr double toDouble() const noexcept {
    return static_cast<double>(_amount) / static_cast<double>(ipow10(static_cast<uint8_t>(_nbDecimals)));
  }

  [[nodiscard]] constexpr bool isZero() const noexcept { return _amount == 0; }

  [[nodiscard]] constexpr bool isStrictlyPositive() const noexcept { return _amount > 0; }

  [[nodiscard]] std::strong_ordering operator<=>(const Decimal &other) const;

  [[nodiscard]] constexpr bool operator==(const Decimal &) const noexcept = default;

  [[nodiscard]] constexpr Decimal abs() const noexcept { return {true, _amount < 0 ? -_amount : _amount, _nbDecimals}; }

  [[nodiscard]] constexpr Decimal operator-() const noexcept { return {true, -_amount, _nbDecimals}; }

  [[nodiscard]] Decimal operator+(Decimal other) const;

  [[nodiscard]] Decimal operator-(Decimal other) const { return *this + (-other); }

  Decimal &operator+=(Decimal other) { return *this = *this + other; }
  Decimal &operator-=(Decimal other) { return *this = *this + (-other); }

  /// Multiplication of two Decimals. Least significant decimals are truncated when the result needs more than 18
  /// digits.
  [[nodiscard]] Decimal operator*(Decimal mult) const;

  Decimal &operator*=(Decimal mult) { return *this = *this * mult; }

  /// Division of two Decimals, computed with the maximum precision allowed by 18 digits (truncated).
  /// Throws invalid_argument if 'div' is zero, and exception if the result is too big.
  [[nodiscard]] Decimal operator/(Decimal div) const;

  Decimal &operator/=(Decimal div) { return *this = *this / div; }

  /// Get 1 / this.
  [[nodiscard]] Decimal inverse() const { return Decimal(1) / *this; }

  /// @brief Appends a string representation of the decimal to given output iterator
  /// @param it output iterator should have at least a capacity of kMaxNbChars
  template <class OutputIt>
  OutputIt append(OutputIt it) const {
    if (_amount < 0) {
      *it = '-';
      ++it;
    }
    const auto nbDigits = ndigits(_amount);
    const auto nbDecs = static_cast<int>(_nbDecimals);
    int remNbZerosToPrint = std::max(0, nbDecs + 1 - nbDigits);

    // no terminating null char, +1 is for the biggest decimal exponent part that is not fully covered by 64 bits
    char amountBuf[std::numeric_limits<AmountType>::digits10 + 1];
    const auto absAmount = static_cast<std::make_unsigned_t<AmountType>>(_amount < 0 ? -_amount : _amount);
    std::to_chars(std::begin(amountBuf), std::end(amountBuf), absAmount);

    int amountCharPos;
    if (remNbZerosToPrint > 0) {
      amountCharPos = 0;
      *it = '0';
      ++it;
      --remNbZerosToPrint;
    } else {
      amountCharPos = nbDigits - nbDecs;
      it = std::copy(std::begin(amountBuf), std::begin(amountBuf) + amountCharPos, it);
    }

    if (nbDecs > 0) {
      *it = '.';
      ++it;
    }
    it = std::fill_n(it, remNbZerosToPrint, '0');
    return std::copy_n(std::begin(amountBuf) + amountCharPos, nbDigits - amountCharPos, it);
  }

  /// Get a string representation of this Decimal.
  [[nodiscard]] std::string str() const {
    std::string ret(kMaxNbChars, '\0');
    ret.erase(append(ret.begin()), ret.end());
    return ret;
  }

  friend std::ostream &operator<<(std::ostream &os, const Decimal &decimal) { return os << decimal.str(); }

  /// +1 for the sign, +1 for the '.', +1 for the first 0 if nbDecimals >= nbDigits
  static constexpr std::size_t kMaxNbChars = std::numeric_limits<AmountType>::digits10 + 3;

 private:
  static constexpr AmountType kMaxAmountFullNDigits = ipow10(kMaxNbDigits);

  /// Private constructor to set fields directly without checks.
  /// We add a dummy bool parameter to differentiate it from the public constructor.
  constexpr Decimal(bool, AmountType amount, int8_t nbDecimals) noexcept : _amount(amount), _nbDecimals(nbDecimals) {}

  constexpr int8_t sanitizeDecimals(int8_t nowNbDecimals, int8_t maxNbDecimals) noexcept {
    const int8_t nbDecimalsToTruncate = nowNbDecimals - maxNbDecimals;
    if (nbDecimalsToTruncate > 0) {
      _amount /= ipow10(static_cast<uint8_t>(nbDecimalsToTruncate));
      nowNbDecimals -= nbDecimalsToTruncate;
    }
    if (_amount == 0) {
      nowNbDecimals = 0;
    } else {
      for (; nowNbDecimals > 0 && _amount % 10 == 0; --nowNbDecimals) {
        _amount /= 10;
      }
    }
    return nowNbDecimals;
  }

  /// Drops the least significant digit if the amount does not fit on kMaxNbDigits digits.
  constexpr int8_t sanitizeIntegralPart(int8_t nbDecs) noexcept {
    if ((_amount >= kMaxAmountFullNDigits || _amount <= -kMaxAmountFullNDigits) && nbDecs > 0) {
      _amount /= 10;
      --nbDecs;
    }
    return nbDecs;
  }

  constexpr void sanitize(int8_t nbDecimals) noexcept {
    if (nbDecimals < 0) {
      // Only non-negative powers of 10 can be represented
      _amount *= ipow10(static_cast<uint8_t>(-nbDecimals));
      nbDecimals = 0;
    }
    _nbDecimals = sanitizeIntegralPart(sanitizeDecimals(nbDecimals, kMaxNbDecimals));
  }

  AmountType _amount{};
  int8_t _nbDecimals{};
};

static_assert(sizeof(Decimal) <= 16, "Decimal size should stay small");
static_assert(std::is_trivially_copyable_v<Decimal>, "Decimal should be trivially copyable");

}  // namespace fxr

template <>
struct fmt::formatter<fxr::Decimal> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxr::Decimal &decimal, FormatContext &ctx) const -> decltype(ctx.out()) {
    return decimal.append(ctx.out());
  }
};
