#include "processcommandsfromcli.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "currencycode.hpp"
#include "datestring.hpp"
#include "decimal.hpp"
#include "file.hpp"
#include "fx-converter.hpp"
#include "fxr_format.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {

namespace {

schema::GeneralConfig LoadGeneralConfigAndOverrideOptionsFromCLI(const FxResolverCmdLineOptions &cmdLineOptions) {
  schema::GeneralConfig generalConfig = ReadGeneralConfig(cmdLineOptions.getDataDir());

  // Override general config options from CLI
  if (!cmdLineOptions.logConsole.empty()) {
    generalConfig.log.consoleLevel = cmdLineOptions.logConsole;
  }
  if (!cmdLineOptions.logFile.empty()) {
    generalConfig.log.fileLevel = cmdLineOptions.logFile;
  }
  if (cmdLineOptions.lookback.isPresent()) {
    if (!cmdLineOptions.lookback.isSet()) {
      throw invalid_argument("Expecting a number of days for option --lookback");
    }
    generalConfig.fxConversion.maxLookbackDays = *cmdLineOptions.lookback;
  }

  return generalConfig;
}

void CheckRequiredOption(std::string_view optionValue, std::string_view optionName) {
  if (optionValue.empty()) {
    throw invalid_argument("Missing mandatory option {}", optionName);
  }
}

}  // namespace

std::string RateResultStr(CurrencyCode from, CurrencyCode to, Date date, const ResolvedRate &resolvedRate) {
  return format("1 {} = {} {} (lookup {}, {})", from, resolvedRate.rate, to, resolvedRate.lookupCurrency,
                DateToString(date));
}

std::string ConversionResultStr(Decimal amount, CurrencyCode from, Decimal convertedAmount, CurrencyCode to) {
  return format("{} {} = {} {}", amount, from, convertedAmount, to);
}

int ProcessCommandsFromCLI(std::string_view programName, const FxResolverCmdLineOptions &cmdLineOptions) {
  CheckRequiredOption(cmdLineOptions.ratesFile, "--rates");
  CheckRequiredOption(cmdLineOptions.from, "--from");
  CheckRequiredOption(cmdLineOptions.to, "--to");

  const CurrencyCode from(cmdLineOptions.from);
  const CurrencyCode to(cmdLineOptions.to);

  std::optional<Decimal> amount;
  if (!cmdLineOptions.amount.empty()) {
    amount = Decimal(cmdLineOptions.amount);
  }

  const schema::GeneralConfig generalConfig = LoadGeneralConfigAndOverrideOptionsFromCLI(cmdLineOptions);

  const LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes, cmdLineOptions.getDataDir(),
                                generalConfig.log);

  log::debug("{} resolving {}-{} with rates of {}", programName, from, to, cmdLineOptions.ratesFile);

  const FxConverter fxConverter(File(cmdLineOptions.ratesFile, File::IfError::kThrow),
                                generalConfig.fxConversion.maxLookbackDays);

  Date date;
  if (cmdLineOptions.date.empty()) {
    const auto latestDate = fxConverter.latestDate(from, to);
    date = latestDate.value_or(Today());
    log::info("No date given, taking {} for {}-{}", DateToString(date), from, to);
  } else {
    date = StringToDate(cmdLineOptions.date);
  }

  const ResolutionResult result = fxConverter.rate(from, to, date);
  if (!result) {
    std::cerr << "Unable to resolve " << from << '-' << to << " at " << DateToString(date) << ": " << result.error()
              << '\n';
    return EXIT_FAILURE;
  }

  auto outputLogger = log::get(LoggingInfo::kOutputLoggerName);
  if (amount) {
    outputLogger->info(ConversionResultStr(*amount, from, *amount * result.rate(), to));
  } else {
    outputLogger->info(RateResultStr(from, to, date, result.resolvedRate()));
  }
  outputLogger->flush();

  return EXIT_SUCCESS;
}

}  // namespace fxr
