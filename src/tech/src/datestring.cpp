#include "datestring.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "fxr_invalid_argument_exception.hpp"
#include "timedef.hpp"

namespace fxr {
namespace {

constexpr std::string_view::size_type kDateStrLen = 10;

int ParseField(std::string_view dateStr, std::string_view::size_type pos, std::string_view::size_type len) {
  const char* begPtr = dateStr.data() + pos;
  const char* endPtr = begPtr + len;
  int value{};
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, value);
  // from_chars accepts a leading minus sign, which is not part of the expected format
  if (*begPtr == '-' || errc != std::errc() || ptr != endPtr) {
    throw invalid_argument("Invalid date '{}', expected format is YYYY-MM-DD", dateStr);
  }
  return value;
}

void Write2(char* buffer, unsigned int value) {
  buffer[0] = static_cast<char>('0' + (value / 10U));
  buffer[1] = static_cast<char>('0' + (value % 10U));
}

}  // namespace

Date StringToDate(std::string_view dateStr) {
  if (dateStr.size() != kDateStrLen || dateStr[4] != '-' || dateStr[7] != '-') {
    throw invalid_argument("Invalid date '{}', expected format is YYYY-MM-DD", dateStr);
  }
  const std::chrono::year_month_day ymd{std::chrono::year{ParseField(dateStr, 0, 4)},
                                        std::chrono::month{static_cast<unsigned int>(ParseField(dateStr, 5, 2))},
                                        std::chrono::day{static_cast<unsigned int>(ParseField(dateStr, 8, 2))}};
  if (!ymd.ok()) {
    throw invalid_argument("Invalid date '{}', it does not exist in the calendar", dateStr);
  }
  return Date{ymd};
}

char* DateToBuffer(Date date, char* buffer) {
  const std::chrono::year_month_day ymd{date};
  const auto year = static_cast<unsigned int>(static_cast<int>(ymd.year()));
  Write2(buffer, year / 100U);
  Write2(buffer + 2, year % 100U);
  buffer[4] = '-';
  Write2(buffer + 5, static_cast<unsigned int>(ymd.month()));
  buffer[7] = '-';
  Write2(buffer + 8, static_cast<unsigned int>(ymd.day()));
  return buffer + kDateStrLen;
}

std::string DateToString(Date date) {
  std::string ret(kDateStrLen, '\0');
  DateToBuffer(date, ret.data());
  return ret;
}

}  // namespace fxr
