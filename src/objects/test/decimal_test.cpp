#include "decimal.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <string_view>

#include "fxr_exception.hpp"
#include "fxr_format.hpp"
#include "fxr_invalid_argument_exception.hpp"

namespace fxr {

TEST(DecimalTest, IntegralRepresentation) {
  Decimal dec1(10856, 4);
  EXPECT_EQ(dec1.amount(), 10856);
  EXPECT_EQ(dec1.nbDecimals(), 4);
  EXPECT_EQ(dec1.integerPart(), 1);
  EXPECT_EQ(dec1.str(), "1.0856");

  Decimal dec2(-25, 2);
  EXPECT_EQ(dec2.str(), "-0.25");

  Decimal dec3(4900, 2);
  EXPECT_EQ(dec3.nbDecimals(), 0);
  EXPECT_EQ(dec3.str(), "49");

  Decimal dec4(0, 10);
  EXPECT_TRUE(dec4.isZero());
  EXPECT_EQ(dec4.nbDecimals(), 0);
  EXPECT_EQ(dec4.str(), "0");

  EXPECT_EQ(Decimal(17).str(), "17");
  EXPECT_EQ(Decimal(-3).str(), "-3");
}

TEST(DecimalTest, FromString) {
  EXPECT_EQ(Decimal("1.0856"), Decimal(10856, 4));
  EXPECT_EQ(Decimal("17.50").str(), "17.5");
  EXPECT_EQ(Decimal("17.50").nbDecimals(), 1);
  EXPECT_EQ(Decimal("-0.00042").str(), "-0.00042");
  EXPECT_EQ(Decimal("  0.27229 ").str(), "0.27229");
  EXPECT_EQ(Decimal(".5").str(), "0.5");
  EXPECT_EQ(Decimal("+3").str(), "3");
  EXPECT_EQ(Decimal("-0").str(), "0");
  EXPECT_EQ(Decimal("000120.000").str(), "120");
}

TEST(DecimalTest, FromStringScientificNotation) {
  EXPECT_EQ(Decimal("2.5e-3").str(), "0.0025");
  EXPECT_EQ(Decimal("1e3").str(), "1000");
  EXPECT_EQ(Decimal("1.5E+2").str(), "150");
  EXPECT_EQ(Decimal("-4.25e1").str(), "-42.5");
}

TEST(DecimalTest, FromStringTooManyDecimals) {
  EXPECT_EQ(Decimal("0.123456789012345678912").str(), "0.12345678901234567");
  EXPECT_EQ(Decimal("12345678901.123456789").str(), "12345678901.1234567");
}

TEST(DecimalTest, FromStringTooSmall) {
  EXPECT_THROW(Decimal("0.0000000000000000012"), invalid_argument);
  EXPECT_THROW(Decimal("-1e-18"), invalid_argument);
  EXPECT_THROW(Decimal("5e-200"), invalid_argument);

  try {
    Decimal("0.0000000000000000012");
    FAIL() << "expected invalid_argument";
  } catch (const invalid_argument &ex) {
    EXPECT_NE(std::string_view(ex.what()).find("0.0000000000000000012"), std::string_view::npos);
  }

  EXPECT_EQ(Decimal("0.00000000000000001").str(), "0.00000000000000001");
  EXPECT_TRUE(Decimal("0.000000000000000000").isZero());
  EXPECT_TRUE(Decimal("0e-200").isZero());
}

TEST(DecimalTest, FromInvalidString) {
  EXPECT_THROW(Decimal(""), invalid_argument);
  EXPECT_THROW(Decimal("-"), invalid_argument);
  EXPECT_THROW(Decimal("abc"), invalid_argument);
  EXPECT_THROW(Decimal("1.2.3"), invalid_argument);
  EXPECT_THROW(Decimal("12a"), invalid_argument);
  EXPECT_THROW(Decimal("1,5"), invalid_argument);
  EXPECT_THROW(Decimal("1e"), invalid_argument);
  EXPECT_THROW(Decimal("1e2.5"), invalid_argument);
}

TEST(DecimalTest, IntegralPartTooBig) {
  EXPECT_NO_THROW(Decimal("999999999999999999"));
  EXPECT_THROW(Decimal("1000000000000000000"), exception);
  EXPECT_THROW(Decimal("1e18"), exception);
}

TEST(DecimalTest, Comparison) {
  EXPECT_LT(Decimal("1.1"), Decimal("1.10001"));
  EXPECT_LT(Decimal("-2"), Decimal("1.5"));
  EXPECT_GT(Decimal("0.27229"), Decimal("0.2722"));
  EXPECT_GT(Decimal("-0.5"), Decimal("-0.50001"));
  EXPECT_EQ(Decimal("1.10"), Decimal("1.1"));
  EXPECT_NE(Decimal("1.10"), Decimal("1.01"));
  EXPECT_LE(Decimal(3), Decimal("3.0"));
}

TEST(DecimalTest, Sign) {
  EXPECT_TRUE(Decimal("0.0001").isStrictlyPositive());
  EXPECT_FALSE(Decimal("0").isStrictlyPositive());
  EXPECT_FALSE(Decimal("-17.5").isStrictlyPositive());
  EXPECT_EQ(Decimal("-17.5").abs(), Decimal("17.5"));
  EXPECT_EQ(-Decimal("17.5"), Decimal("-17.5"));
}

TEST(DecimalTest, Addition) {
  EXPECT_EQ(Decimal("1.1") + Decimal("2.25"), Decimal("3.35"));
  EXPECT_EQ(Decimal("0.1") - Decimal("0.3"), Decimal("-0.2"));
  EXPECT_EQ(Decimal("0.99999999999999999") + Decimal(1), Decimal("1.99999999999999999"));

  Decimal dec("10");
  dec += Decimal("0.5");
  dec -= Decimal("3");
  EXPECT_EQ(dec, Decimal("7.5"));
}

TEST(DecimalTest, AdditionOverflow) {
  EXPECT_THROW(Decimal(999999999999999999L) + Decimal(1), exception);
}

TEST(DecimalTest, Multiplication) {
  EXPECT_EQ(Decimal("1.5") * Decimal(2), Decimal(3));
  EXPECT_EQ(Decimal("1.0856") * Decimal(100), Decimal("108.56"));
  EXPECT_EQ(Decimal("-0.25") * Decimal("0.5"), Decimal("-0.125"));
  EXPECT_EQ(Decimal(100) * (Decimal(1) / Decimal("17.5")), Decimal("5.71428571428571"));

  Decimal dec("2.5");
  dec *= Decimal(4);
  EXPECT_EQ(dec, Decimal(10));
}

TEST(DecimalTest, MultiplicationOverflow) {
  EXPECT_THROW(Decimal(1000000000) * Decimal(1000000000), exception);
}

TEST(DecimalTest, Division) {
  EXPECT_EQ(Decimal(1) / Decimal(4), Decimal("0.25"));
  EXPECT_EQ(Decimal(1) / Decimal(8), Decimal("0.125"));
  EXPECT_EQ(Decimal(-7) / Decimal(2), Decimal("-3.5"));
  EXPECT_EQ(Decimal(1) / Decimal(3), Decimal("0.33333333333333333"));
  EXPECT_EQ(Decimal("0.0000000001") / Decimal(3), Decimal("0.00000000003333333"));
  EXPECT_EQ(Decimal(123456789) / Decimal("0.001"), Decimal(123456789000L));
  EXPECT_EQ(Decimal(0) / Decimal("1.0856"), Decimal(0));
}

TEST(DecimalTest, DivisionIsTruncated) {
  EXPECT_EQ(Decimal("1.0856").inverse(), Decimal("0.92114959469417833"));
  EXPECT_EQ(Decimal("17.5").inverse(), Decimal("0.05714285714285714"));
  EXPECT_EQ(Decimal("1.10") / Decimal("0.27229"), Decimal("4.03981049616218002"));
  EXPECT_EQ(Decimal("0.27229") / Decimal("1.10"), Decimal("0.24753636363636363"));
}

TEST(DecimalTest, DivisionByZero) {
  EXPECT_THROW(Decimal(1) / Decimal(0), invalid_argument);
  EXPECT_THROW(Decimal().inverse(), invalid_argument);
}

TEST(DecimalTest, DivisionOverflow) {
  EXPECT_THROW(Decimal(100000000000000000L) / Decimal("0.001"), exception);
}

TEST(DecimalTest, Format) {
  EXPECT_EQ(format("{}", Decimal("108.56")), "108.56");
  EXPECT_EQ(format("rate {} for {}", Decimal("-0.0025"), 2), "rate -0.0025 for 2");
}

TEST(DecimalTest, ToDouble) {
  EXPECT_DOUBLE_EQ(Decimal("1.0856").toDouble(), 1.0856);
  EXPECT_NEAR(Decimal("17.5").inverse().toDouble(), 0.05714, 1e-5);
}

}  // namespace fxr
