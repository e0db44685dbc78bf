#pragma once

#include <string_view>

#include "commandlineoption.hpp"
#include "fx-converter.hpp"
#include "fxr_const.hpp"
#include "parseloglevel.hpp"
#include "static_string_view_helpers.hpp"
#include "staticcommandlineoptioncheck.hpp"

namespace fxr {

class FxResolverCmdLineOptionsDefinitions {
 protected:
  static constexpr std::string_view kLogValue1 = "<levelName|0-";
  static constexpr std::string_view kLogValue =
      JoinStringView_v<kLogValue1, IntToStringView_v<kNbLogLevels - 1>, CharToStringView_v<'>'>>;

  static constexpr std::string_view kLoggingLevelsSep = "|";
  static constexpr std::string_view kLoggingLevels = make_joined_string_view<kLoggingLevelsSep, kLogLevelNames>::value;

  static constexpr std::string_view kLog1 =
      "Sets the log level in the console during all execution. "
      "Possible values are: (";
  static constexpr std::string_view kLog2 = ") or (0-";
  static constexpr std::string_view kLog3 = ") (overrides .log.consoleLevel in general config file)";
  static constexpr std::string_view kLog =
      JoinStringView_v<kLog1, kLoggingLevels, kLog2, IntToStringView_v<kNbLogLevels - 1>, kLog3>;

  static constexpr std::string_view kData1 = "Use given 'data' directory instead of the one chosen at build time '";
  static constexpr std::string_view kData = JoinStringView_v<kData1, kDefaultDataDir, CharToStringView_v<'\''>>;

  static constexpr std::string_view kLookback1 =
      "Number of days before the requested date for which a stale rate is still accepted (default: ";
  static constexpr std::string_view kLookback2 = ", overrides .fxConversion.maxLookbackDays in general config file)";
  static constexpr std::string_view kLookback =
      JoinStringView_v<kLookback1, IntToStringView_v<FxConverter::kDefaultLookbackDays>, kLookback2>;
};

template <class OptValueType>
struct FxResolverAllowedOptions : private FxResolverCmdLineOptionsDefinitions {
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;

  static constexpr CommandLineOptionWithValue value[] = {
      {{{"General", 100}, "help", 'h', "", "Display this information"}, &OptValueType::help},
      {{{"General", 200}, "--data", "<path/to/data>", kData}, &OptValueType::dataDir},
      {{{"General", 300}, "--log", 'v', kLogValue, kLog}, &OptValueType::logConsole},
      {{{"General", 400}, "--log-console", kLogValue, "Synonym of --log"}, &OptValueType::logConsole},
      {{{"General", 400},
        "--log-file",
        kLogValue,
        "Sets the log level in files during all execution (overrides .log.fileLevel in general config file). "
        "Number of rotating files to keep and their size is configurable in the general config file"},
       &OptValueType::logFile},
      {{{"General", 900}, "version", "", "Display program version"}, &OptValueType::version},
      {{{"Rate query", 1000},
        "--rates",
        'r',
        "<path/to/rates.json>",
        "Rates snapshot file, holding the provider of the rates, its dated rates series and its pegs"},
       &OptValueType::ratesFile},
      {{{"Rate query", 1000}, "--from", 'f', "<cur>", "Currency to convert from"}, &OptValueType::from},
      {{{"Rate query", 1000}, "--to", 't', "<cur>", "Currency to convert to"}, &OptValueType::to},
      {{{"Rate query", 1000},
        "--date",
        'd',
        "<YYYY-MM-DD>",
        "Date of the rate. If not provided, the latest date available for the lookup currency of the pair is used"},
       &OptValueType::date},
      {{{"Rate query", 1000},
        "--amount",
        'a',
        "<decimal>",
        "Amount of the 'from' currency to convert instead of printing the unit rate"},
       &OptValueType::amount},
      {{{"Rate query", 1000}, "--lookback", "<days>", kLookback}, &OptValueType::lookback},
  };

  static_assert(StaticCommandLineOptionsCheck(value),
                "Duplicated option names, or description starting or ending with a '\\n' or space");
};

}  // namespace fxr
