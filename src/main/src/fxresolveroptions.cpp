#include "fxresolveroptions.hpp"

#include <cstdlib>
#include <ostream>
#include <string_view>

#include "fxr_config.hpp"
#include "fxr_const.hpp"

namespace fxr {

std::string_view FxResolverCmdLineOptions::SelectDefaultDataDir() noexcept {
  const char* pDataDirEnvValue = std::getenv("FXR_DATA_DIR");
  if (pDataDirEnvValue != nullptr) {
    return pDataDirEnvValue;
  }
  return kDefaultDataDir;
}

std::ostream& FxResolverCmdLineOptions::PrintVersion(std::string_view programName, std::ostream& os) noexcept {
  os << programName << " version " << FXR_VERSION << '\n';
  os << "compiled with " << FXR_COMPILER_VERSION << " on " << __DATE__ << " at " << __TIME__ << '\n';
  return os;
}

}  // namespace fxr
