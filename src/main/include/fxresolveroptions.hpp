#pragma once

#include <ostream>
#include <string_view>

#include "commandlineoption.hpp"

namespace fxr {

class FxResolverCmdLineOptions {
 public:
  static std::ostream& PrintVersion(std::string_view programName, std::ostream& os) noexcept;

  constexpr FxResolverCmdLineOptions() noexcept = default;

  std::string_view getDataDir() const { return dataDir.empty() ? SelectDefaultDataDir() : dataDir; }

  /// Tells whether a rate query has been asked. If false, nothing needs to be resolved.
  bool hasRateQuery() const noexcept { return !ratesFile.empty() || !from.empty() || !to.empty(); }

  std::string_view dataDir;

  std::string_view logConsole;
  std::string_view logFile;

  std::string_view ratesFile;
  std::string_view from;
  std::string_view to;
  std::string_view date;
  std::string_view amount;

  CommandLineOptionalInt32 lookback;

  bool help = false;
  bool version = false;

 private:
  static std::string_view SelectDefaultDataDir() noexcept;
};

}  // namespace fxr
