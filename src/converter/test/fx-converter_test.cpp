#include "fx-converter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "currencycode.hpp"
#include "decimal.hpp"
#include "fxr_exception.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "peg-table.hpp"
#include "provider-descriptor.hpp"
#include "rate-table.hpp"
#include "reader.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {

using std::chrono::January;
using namespace std::chrono_literals;

namespace {
constexpr Date kDate{2024y / January / 15};

class DummyRatesSnapshotReader : public Reader {
  [[nodiscard]] std::string readAll() const override {
    return R"(
{
  "bankId": "",
  "provider": {
    "base": "EUR",
    "quoteConvention": "indirect"
  },
  "rates": {
    "USD": {
      "2024-01-12": "1.0950",
      "2024-01-15": "1.0856"
    },
    "JPY": {
      "2024-01-15": "160.25"
    },
    "GBP": {
      "2024-01-10": "0.8600"
    }
  },
  "pegs": {
    "AED": {
      "peggedTo": "USD",
      "rate": "0.27229"
    },
    "BGN": {
      "peggedTo": "EUR",
      "rate": "0.51129"
    }
  }
}
)";
  }
};
}  // namespace

class FxConverterTest : public ::testing::Test {
 protected:
  FxConverter converter{DummyRatesSnapshotReader{}};
};

TEST_F(FxConverterTest, LoadedFromSnapshot) {
  EXPECT_EQ(converter.provider(), ProviderDescriptor("EUR", QuoteConvention::indirect));
  EXPECT_EQ(converter.rates().size(), 3);
  EXPECT_EQ(converter.rates().nbRates(), 4);
  EXPECT_EQ(converter.rates().rate("USD", kDate - days(3)), Decimal("1.095"));
  EXPECT_EQ(converter.pegs().size(), 2);
  EXPECT_EQ(converter.pegs().find("AED"), (Peg{"USD", Decimal("0.27229")}));
  EXPECT_EQ(converter.lookbackDays(), FxConverter::kDefaultLookbackDays);
}

TEST_F(FxConverterTest, RateWithBaseCurrency) {
  EXPECT_EQ(converter.rate("EUR", "USD", kDate), ResolutionResult(ResolvedRate{Decimal("1.0856"), "USD"}));
  EXPECT_EQ(converter.rate("USD", "EUR", kDate), ResolutionResult(ResolvedRate{Decimal("0.92114959469417833"), "USD"}));
  EXPECT_EQ(converter.rate("EUR", "AED", kDate).lookupCurrency(), CurrencyCode("AED"));
  EXPECT_EQ(converter.rate("JPY", "JPY", kDate), ResolutionResult(ResolvedRate{Decimal(1), "JPY"}));
}

TEST_F(FxConverterTest, LookbackWindow) {
  // week-end without publication, rate of Friday is used
  EXPECT_EQ(converter.rate("EUR", "USD", kDate - days(1)).rate(), Decimal("1.095"));
  EXPECT_EQ(converter.rate("EUR", "USD", kDate + days(7)).rate(), Decimal("1.0856"));

  EXPECT_EQ(converter.rate("EUR", "USD", kDate + days(8)),
            ResolutionResult(ResolutionError(ResolutionError::Type::kNoRateFound, "USD")));
  EXPECT_EQ(converter.rate("EUR", "GBP", kDate + days(3)),
            ResolutionResult(ResolutionError(ResolutionError::Type::kNoRateFound, "GBP")));
  EXPECT_EQ(converter.rate("EUR", "USD", kDate - days(4)),
            ResolutionResult(ResolutionError(ResolutionError::Type::kNoRateFound, "USD")));
}

TEST_F(FxConverterTest, NoLookback) {
  FxConverter strictConverter(DummyRatesSnapshotReader{}, 0);

  EXPECT_TRUE(strictConverter.rate("EUR", "USD", kDate).isOk());
  EXPECT_EQ(strictConverter.rate("EUR", "USD", kDate - days(1)),
            ResolutionResult(ResolutionError(ResolutionError::Type::kNoRateFound, "USD")));
}

TEST_F(FxConverterTest, CrossRate) {
  EXPECT_EQ(converter.rate("USD", "JPY", kDate), ResolutionResult(ResolvedRate{Decimal("147.614222549729525"), "JPY"}));
  EXPECT_EQ(converter.rate("JPY", "USD", kDate), ResolutionResult(ResolvedRate{Decimal("0.00677441497659863"), "USD"}));
  EXPECT_EQ(converter.rate("AED", "JPY", kDate), ResolutionResult(ResolvedRate{Decimal("40.1938766580568"), "JPY"}));
}

TEST_F(FxConverterTest, CrossRateFailureOfFirstLeg) {
  EXPECT_EQ(converter.rate("XYZ", "USD", kDate),
            ResolutionResult(ResolutionError(ResolutionError::Type::kUnsupportedCurrency, "XYZ")));
  EXPECT_EQ(converter.rate("GBP", "XYZ", kDate + days(3)),
            ResolutionResult(ResolutionError(ResolutionError::Type::kNoRateFound, "GBP")));
}

TEST_F(FxConverterTest, CrossRateFailureOfSecondLeg) {
  EXPECT_EQ(converter.rate("USD", "XYZ", kDate),
            ResolutionResult(ResolutionError(ResolutionError::Type::kUnsupportedCurrency, "XYZ")));
}

TEST_F(FxConverterTest, Convert) {
  EXPECT_EQ(converter.convert(Decimal(100), "EUR", "USD", kDate), Decimal("108.56"));
  EXPECT_EQ(converter.convert(Decimal(100), "USD", "JPY", kDate), Decimal("14761.4222549729"));
  EXPECT_EQ(converter.convert(Decimal("-2.5"), "EUR", "EUR", kDate), Decimal("-2.5"));
  EXPECT_EQ(converter.convert(Decimal(0), "EUR", "USD", kDate), Decimal(0));
}

TEST_F(FxConverterTest, ConvertFailure) {
  EXPECT_EQ(converter.convert(Decimal(100), "EUR", "XYZ", kDate), std::nullopt);
  EXPECT_EQ(converter.convert(Decimal(100), "EUR", "GBP", kDate + days(3)), std::nullopt);
}

TEST_F(FxConverterTest, LatestDate) {
  EXPECT_EQ(converter.latestDate("USD"), kDate);
  EXPECT_EQ(converter.latestDate("GBP"), kDate - days(5));
  EXPECT_EQ(converter.latestDate("AED"), kDate);
  EXPECT_EQ(converter.latestDate("BGN"), std::nullopt);
  EXPECT_EQ(converter.latestDate("EUR"), std::nullopt);
  EXPECT_EQ(converter.latestDate("XYZ"), std::nullopt);
}

TEST_F(FxConverterTest, LatestDateOfPair) {
  EXPECT_EQ(converter.latestDate("EUR", "USD"), kDate);
  EXPECT_EQ(converter.latestDate("GBP", "USD"), kDate - days(5));
  EXPECT_EQ(converter.latestDate("BGN", "EUR"), std::nullopt);
  EXPECT_EQ(converter.latestDate("BGN", "JPY"), kDate);
}

TEST(FxConverterLatestDateTest, CircularPegs) {
  PegTable pegs;
  pegs.insert("AAA", Peg{"BBB", Decimal("1.5")});
  pegs.insert("BBB", Peg{"AAA", Decimal("0.5")});

  FxConverter converter(ProviderDescriptor("EUR", QuoteConvention::indirect), RateTable(), std::move(pegs));

  EXPECT_EQ(converter.latestDate("AAA"), std::nullopt);
  EXPECT_EQ(converter.rate("EUR", "AAA", kDate),
            ResolutionResult(ResolutionError(ResolutionError::Type::kCircularPeg, "AAA")));
}

TEST(FxConverterConstructionTest, DirectProvider) {
  RateTable rates;
  rates.insert("USD", kDate, Decimal("17.5"));

  FxConverter converter(ProviderDescriptor("MXN", QuoteConvention::direct), std::move(rates), PegTable());

  EXPECT_EQ(converter.convert(Decimal(20), "USD", "MXN", kDate), Decimal(350));
  EXPECT_EQ(converter.convert(Decimal(350), "MXN", "USD", kDate), Decimal("19.999999999999985"));
}

TEST(FxConverterConstructionTest, NegativeLookback) {
  EXPECT_THROW(FxConverter(ProviderDescriptor("EUR", QuoteConvention::indirect), RateTable(), PegTable(), -1),
               invalid_argument);
}

TEST(FxConverterConstructionTest, BankIdTakesPrecedence) {
  class BankIdReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "MXCB", "provider": {"base": "EUR", "quoteConvention": "indirect"},
                 "rates": {"USD": {"2024-01-15": "17.5"}}})";
    }
  };

  FxConverter converter{BankIdReader{}};

  EXPECT_EQ(converter.provider(), ProviderDescriptor("MXN", QuoteConvention::direct));
  EXPECT_EQ(converter.rate("USD", "MXN", kDate).rate(), Decimal("17.5"));
}

TEST(FxConverterConstructionTest, MissingProvider) {
  class MissingProviderReader : public Reader {
    [[nodiscard]] std::string readAll() const override { return R"({"rates": {"USD": {"2024-01-15": "1.0856"}}})"; }
  };

  EXPECT_THROW(FxConverter{MissingProviderReader{}}, invalid_argument);
}

TEST(FxConverterConstructionTest, UnknownBankId) {
  class UnknownBankIdReader : public Reader {
    [[nodiscard]] std::string readAll() const override { return R"({"bankId": "USFED"})"; }
  };

  EXPECT_THROW(FxConverter{UnknownBankIdReader{}}, invalid_argument);
}

TEST(FxConverterConstructionTest, InvalidSnapshotValues) {
  class InvalidDateReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "EUECB", "rates": {"USD": {"2024-02-30": "1.0856"}}})";
    }
  };
  class InvalidRateReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "EUECB", "rates": {"USD": {"2024-01-15": "1,0856"}}})";
    }
  };
  class NegativeRateReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "EUECB", "rates": {"USD": {"2024-01-15": "-1.0856"}}})";
    }
  };
  class SelfPegReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "EUECB", "pegs": {"AED": {"peggedTo": "aed", "rate": "1"}}})";
    }
  };

  EXPECT_THROW(FxConverter{InvalidDateReader{}}, invalid_argument);
  EXPECT_THROW(FxConverter{InvalidRateReader{}}, invalid_argument);
  EXPECT_THROW(FxConverter{NegativeRateReader{}}, invalid_argument);
  EXPECT_THROW(FxConverter{SelfPegReader{}}, invalid_argument);
}

TEST(FxConverterConstructionTest, RateBeyondDecimalPrecision) {
  class TinyRateReader : public Reader {
    [[nodiscard]] std::string readAll() const override {
      return R"({"bankId": "EUECB", "rates": {"JPY": {"2024-01-15": "0.0000000000000000012"}}})";
    }
  };

  try {
    FxConverter converter{TinyRateReader{}};
    FAIL() << "expected invalid_argument";
  } catch (const invalid_argument &ex) {
    EXPECT_NE(std::string_view(ex.what()).find("0.0000000000000000012"), std::string_view::npos);
  }
}

TEST(FxConverterConstructionTest, MalformedJson) {
  class MalformedJsonReader : public Reader {
    [[nodiscard]] std::string readAll() const override { return R"({"bankId": "EUECB", "rates": {"USD": )"; }
  };

  EXPECT_THROW(FxConverter{MalformedJsonReader{}}, exception);
}

}  // namespace fxr
