#pragma once

#include <cstdint>
#include <string>

namespace fxr::schema {

struct LogConfig {
  std::string consoleLevel{"info"};
  std::string fileLevel{"off"};
  int64_t maxFileSize{5L * 1024 * 1024};
  int32_t maxNbFiles{10};
};

}  // namespace fxr::schema
