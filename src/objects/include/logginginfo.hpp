#pragma once

#include <cstdint>
#include <string_view>

#include "fxr_const.hpp"
#include "fxr_log.hpp"
#include "log-config.hpp"

namespace fxr {

/// @brief Sets up the loggers for its lifetime: the default logger (console and optional rotating files) and the
/// 'output' logger, printing results on standard output without any decoration.
class LoggingInfo {
 public:
  static constexpr int64_t kDefaultFileSizeInBytes = 5L * 1024 * 1024;
  static constexpr int32_t kDefaultNbMaxFiles = 10;
  static constexpr char const *const kOutputLoggerName = "output";
  static constexpr std::string_view kLogFileName = "log.txt";

  enum class WithLoggersCreation : int8_t { kNo, kYes };

  /// Creates a default logging info, with level 'info' on standard error.
  explicit LoggingInfo(WithLoggersCreation withLoggersCreation = WithLoggersCreation::kNo,
                       std::string_view dataDir = kDefaultDataDir);

  /// Creates a logging info from the log part of the general config.
  /// Throws invalid_argument for unknown log levels or non positive rotating files settings.
  LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir, const schema::LogConfig &logConfig);

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo &operator=(const LoggingInfo &) = delete;

  ~LoggingInfo();

  int64_t maxFileSizeLogFileInBytes() const { return _maxFileSizeLogFileInBytes; }

  int32_t maxNbLogFiles() const { return _maxNbLogFiles; }

  log::level::level_enum logConsole() const { return _consoleLevel; }
  log::level::level_enum logFile() const { return _fileLevel; }

 private:
  void createLoggers() const;

  std::string_view _dataDir;
  int64_t _maxFileSizeLogFileInBytes = kDefaultFileSizeInBytes;
  int32_t _maxNbLogFiles = kDefaultNbMaxFiles;
  log::level::level_enum _consoleLevel = log::level::info;
  log::level::level_enum _fileLevel = log::level::off;
  bool _loggersCreated = false;
};

}  // namespace fxr
