#pragma once

#include <cstdint>
#include <string_view>

#include "log-config.hpp"

namespace fxr {

namespace schema {

struct FxConversionConfig {
  /// Number of days before the requested date for which a published rate is still accepted
  int32_t maxLookbackDays{7};
};

struct GeneralConfig {
  FxConversionConfig fxConversion;
  LogConfig log;
};

}  // namespace schema

/// Reads the general configuration file of given data directory, creating it with default values if it does not exist.
schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir);

}  // namespace fxr
