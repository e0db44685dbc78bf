#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "fxr_format.hpp"
#include "fxr_invalid_argument_exception.hpp"

namespace fxr {

/// Currency identifier (ISO 4217 codes such as 'EUR', 'USD', or any non standard code up to 10 chars).
/// Fits in 64 bits: each char between '!' and '_' of the ASCII table is coded on 6 bits, from the most significant bits
/// first, so that the natural order of the code is the lexicographical order of the acronym.
/// Lower case letters are converted to upper case, so that 'eur' and 'EUR' are the same currency.
/// A default constructed CurrencyCode is neutral (empty acronym).
class CurrencyCode {
 public:
  static constexpr int kMaxLen = 10;

  constexpr CurrencyCode() noexcept = default;

  template <unsigned N>
    requires(N <= static_cast<unsigned>(kMaxLen) + 1U)
  constexpr CurrencyCode(const char (&acronym)[N]) : _data(Encode(std::string_view(acronym, N - 1U))) {}

  /// Throws invalid_argument if 'acronym' is too long or contains an unauthorized char.
  constexpr CurrencyCode(std::string_view acronym) {
    if (acronym.size() > static_cast<std::string_view::size_type>(kMaxLen)) {
      throw invalid_argument("Acronym '{}' is too long to fit in a CurrencyCode", acronym);
    }
    _data = Encode(acronym);
  }

  constexpr int size() const noexcept {
    int sz = 0;
    while (sz < kMaxLen && DecodedChar(_data, sz) != kNoChar) {
      ++sz;
    }
    return sz;
  }

  std::string str() const {
    std::string ret(static_cast<std::string::size_type>(size()), '\0');
    append(ret.begin());
    return ret;
  }

  /// Writes the acronym chars to given output iterator, and returns the iterator after the last written char.
  template <class OutputIt>
  constexpr OutputIt append(OutputIt it) const {
    const int sz = size();
    for (int charPos = 0; charPos < sz; ++charPos) {
      *it = DecodedChar(_data, charPos);
      ++it;
    }
    return it;
  }

  constexpr uint64_t code() const noexcept { return _data; }

  constexpr char operator[](int pos) const noexcept { return DecodedChar(_data, pos); }

  constexpr std::strong_ordering operator<=>(const CurrencyCode &) const noexcept = default;

  constexpr bool operator==(const CurrencyCode &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const CurrencyCode &cur) { return os << cur.str(); }

 private:
  static constexpr uint64_t kNbBitsChar = 6;
  static constexpr uint64_t kCharMask = (uint64_t{1} << kNbBitsChar) - 1U;
  // 10 chars of 6 bits leave the 4 least significant bits unused
  static constexpr uint64_t kNbUnusedBits = 64U - static_cast<uint64_t>(kMaxLen) * kNbBitsChar;

  // coded as 0, so that unused char slots are null bits
  static constexpr char kNoChar = ' ';
  static constexpr char kLastChar = '_';

  static constexpr char ToUpper(char ch) noexcept {
    return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - 'a' + 'A') : ch;
  }

  static constexpr bool IsValidChar(char ch) noexcept {
    ch = ToUpper(ch);
    return ch > kNoChar && ch <= kLastChar;
  }

  static constexpr int BitShift(int charPos) noexcept {
    return static_cast<int>(kNbUnusedBits + kNbBitsChar * static_cast<uint64_t>(kMaxLen - 1 - charPos));
  }

  static constexpr char DecodedChar(uint64_t data, int charPos) noexcept {
    return static_cast<char>(((data >> BitShift(charPos)) & kCharMask) + static_cast<uint64_t>(kNoChar));
  }

  static constexpr uint64_t Encode(std::string_view acronym) {
    uint64_t data = 0;
    int charPos = 0;
    for (const char ch : acronym) {
      if (!IsValidChar(ch)) {
        throw invalid_argument("Unexpected char '{}' in acronym '{}'", ch, acronym);
      }
      data |= static_cast<uint64_t>(ToUpper(ch) - kNoChar) << BitShift(charPos++);
    }
    return data;
  }

  uint64_t _data{};
};

}  // namespace fxr

template <>
struct fmt::formatter<fxr::CurrencyCode> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxr::CurrencyCode &cur, FormatContext &ctx) const -> decltype(ctx.out()) {
    return cur.append(ctx.out());
  }
};

// Specialize std::hash<CurrencyCode> for easy usage of CurrencyCode as unordered_map key
namespace std {
template <>
struct hash<fxr::CurrencyCode> {
  auto operator()(const fxr::CurrencyCode &currencyCode) const { return std::hash<uint64_t>()(currencyCode.code()); }
};
}  // namespace std
