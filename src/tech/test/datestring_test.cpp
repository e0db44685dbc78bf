#include "datestring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "fxr_invalid_argument_exception.hpp"
#include "timedef.hpp"

namespace fxr {

using std::chrono::January;
using std::chrono::March;
using std::chrono::year;

TEST(DateStringTest, StringToDate) {
  EXPECT_EQ(StringToDate("2024-01-15"), Date{year{2024} / January / 15});
  EXPECT_EQ(StringToDate("1999-03-01"), Date{year{1999} / March / 1});
  EXPECT_EQ(StringToDate("1970-01-01").time_since_epoch().count(), 0);
}

TEST(DateStringTest, StringToDateInvalidFormat) {
  EXPECT_THROW(StringToDate(""), invalid_argument);
  EXPECT_THROW(StringToDate("2024/01/15"), invalid_argument);
  EXPECT_THROW(StringToDate("2024-1-15"), invalid_argument);
  EXPECT_THROW(StringToDate("2024-01-15T10:00:00"), invalid_argument);
  EXPECT_THROW(StringToDate("2O24-01-15"), invalid_argument);
  EXPECT_THROW(StringToDate("-123-01-15"), invalid_argument);
}

TEST(DateStringTest, StringToDateNonExistingDay) {
  EXPECT_THROW(StringToDate("2023-02-29"), invalid_argument);
  EXPECT_THROW(StringToDate("2024-13-01"), invalid_argument);
  EXPECT_NO_THROW(StringToDate("2024-02-29"));
}

TEST(DateStringTest, DateToString) {
  EXPECT_EQ(DateToString(Date{year{2024} / January / 15}), "2024-01-15");
  EXPECT_EQ(DateToString(Date{year{987} / March / 9}), "0987-03-09");
}

TEST(DateStringTest, DayArithmetic) {
  const Date date = StringToDate("2024-03-01");
  EXPECT_EQ(DateToString(date - days(1)), "2024-02-29");
  EXPECT_EQ(DateToString(date - days(61)), "2023-12-31");
  EXPECT_EQ(DateToDaysSinceEpoch(StringToDate("1970-01-11")), 10);
}

}  // namespace fxr
