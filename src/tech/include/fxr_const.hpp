#pragma once

#include <string_view>

namespace fxr {

#ifndef FXR_DATA_DIR
#define FXR_DATA_DIR "data"
#endif

static constexpr std::string_view kDefaultDataDir = FXR_DATA_DIR;

static constexpr std::string_view kGeneralConfigFileName = "generalconfig.json";

}  // namespace fxr
