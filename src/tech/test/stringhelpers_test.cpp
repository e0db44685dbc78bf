#include "stringhelpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "fxr_invalid_argument_exception.hpp"

namespace fxr {

TEST(FromString, PositiveValue) {
  EXPECT_EQ(FromString<int>("7"), 7);
  EXPECT_EQ(FromString<int32_t>("365"), 365);
  EXPECT_EQ(FromString<int64_t>("1705312800"), 1705312800);
}

TEST(FromString, NegativeValue) {
  EXPECT_EQ(FromString<int>("-3"), -3);
  EXPECT_EQ(FromString<int8_t>("-128"), -128);
}

TEST(FromString, InvalidValue) {
  EXPECT_THROW(FromString<int>(""), invalid_argument);
  EXPECT_THROW(FromString<int>("seven"), invalid_argument);
  EXPECT_THROW(FromString<int>("7d"), invalid_argument);
  EXPECT_THROW(FromString<uint32_t>("-1"), invalid_argument);
}

TEST(FromString, OutOfRange) {
  EXPECT_THROW(FromString<int8_t>("128"), invalid_argument);
  EXPECT_THROW(FromString<int32_t>("4294967296"), invalid_argument);
}

}  // namespace fxr
