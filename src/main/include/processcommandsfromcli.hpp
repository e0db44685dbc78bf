#pragma once

#include <string>
#include <string_view>

#include "currencycode.hpp"
#include "decimal.hpp"
#include "fxresolveroptions.hpp"
#include "resolution-result.hpp"
#include "timedef.hpp"

namespace fxr {

/// Formats a resolved rate as '1 EUR = 1.0856 USD (lookup USD, 2024-01-15)'.
std::string RateResultStr(CurrencyCode from, CurrencyCode to, Date date, const ResolvedRate &resolvedRate);

/// Formats a conversion as '100 EUR = 108.56 USD'.
std::string ConversionResultStr(Decimal amount, CurrencyCode from, Decimal convertedAmount, CurrencyCode to);

/// Loads configuration and rates snapshot, resolves the query given on the command line and prints its result.
/// Returns EXIT_SUCCESS if the query has been resolved, EXIT_FAILURE otherwise (the error is printed on stderr).
/// Throws invalid_argument if the options are incomplete or invalid.
int ProcessCommandsFromCLI(std::string_view programName, const FxResolverCmdLineOptions &cmdLineOptions);

}  // namespace fxr
