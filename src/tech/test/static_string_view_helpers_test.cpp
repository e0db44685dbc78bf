#include "static_string_view_helpers.hpp"

#include <string_view>

namespace fxr {

struct NoString {
  static_assert(JoinStringView_v<>.empty());
};

struct SingleString {
  static constexpr std::string_view kEur = "EUR";

  static_assert(JoinStringView_v<kEur> == "EUR");
};

struct ConcatenatedStrings {
  static constexpr std::string_view kFrom = "from ";
  static constexpr std::string_view kEur = "EUR";
  static constexpr std::string_view kTo = " to ";
  static constexpr std::string_view kUsd = "USD";

  static_assert(JoinStringView_v<kFrom, kEur, kTo, kUsd> == "from EUR to USD");
  static_assert(JoinStringView_v<kEur, CharToStringView_v<'/'>, kUsd> == "EUR/USD");
};

struct ConcatenatedStringsWithInts {
  static constexpr std::string_view kLookback = "Look back up to ";
  static constexpr std::string_view kDays = " days";

  static_assert(JoinStringView_v<kLookback, IntToStringView_v<7>, kDays> == "Look back up to 7 days");
};

struct SeparatedStrings {
  static constexpr std::string_view kSep = ", ";
  static constexpr std::string_view kEur = "EUR";
  static constexpr std::string_view kUsd = "USD";
  static constexpr std::string_view kJpy = "JPY";

  static_assert(JoinStringViewWithSep_v<kSep, kEur, kUsd, kJpy> == "EUR, USD, JPY");
  static_assert(JoinStringViewWithSep_v<kSep, kEur> == "EUR");
  static_assert(JoinStringViewWithSep_v<kSep>.empty());

  static constexpr std::string_view kPipe = "|";
  static constexpr std::string_view kBanks[] = {"EUECB", "MXCB"};

  static_assert(make_joined_string_view<kPipe, kBanks>::value == "EUECB|MXCB");
};

static_assert(IntToStringView_v<0> == "0");
static_assert(IntToStringView_v<18> == "18");
static_assert(IntToStringView_v<-4096> == "-4096");

}  // namespace fxr
