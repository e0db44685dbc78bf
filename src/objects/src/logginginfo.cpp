#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "file.hpp"
#include "fxr_fixedcapacityvector.hpp"
#include "fxr_invalid_argument_exception.hpp"
#include "fxr_log.hpp"
#include "log-config.hpp"
#include "parseloglevel.hpp"

namespace fxr {

namespace {

constexpr std::size_t kAsyncQueueSize = 8192;

// a single logger thread keeps the order of the messages between the default and the output loggers
constexpr std::size_t kNbLoggerThreads = 1;

void CreateOutputLogger() {
  // a previous LoggingInfo may have left it
  log::drop(LoggingInfo::kOutputLoggerName);

  auto outputLogger = std::make_shared<log::async_logger>(LoggingInfo::kOutputLoggerName,
                                                          std::make_shared<log::sinks::stdout_color_sink_mt>(),
                                                          log::thread_pool(), log::async_overflow_policy::block);
  outputLogger->set_level(log::level::info);
  outputLogger->set_pattern("%v");

  log::register_logger(std::move(outputLogger));
}

}  // namespace

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir) : _dataDir(dataDir) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
    _loggersCreated = true;
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir,
                         const schema::LogConfig &logConfig)
    : _dataDir(dataDir),
      _maxFileSizeLogFileInBytes(logConfig.maxFileSize),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _consoleLevel(LevelFromPos(LogPosFromLogStr(logConfig.consoleLevel))),
      _fileLevel(LevelFromPos(LogPosFromLogStr(logConfig.fileLevel))) {
  if (_maxFileSizeLogFileInBytes <= 0 || _maxNbLogFiles <= 0) {
    throw invalid_argument("Invalid log file rotation settings: max file size {}, max nb files {}",
                           _maxFileSizeLogFileInBytes, _maxNbLogFiles);
  }
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
    _loggersCreated = true;
  }
}

LoggingInfo::~LoggingInfo() {
  if (_loggersCreated) {
    log::drop(kOutputLoggerName);
  }
}

void LoggingInfo::createLoggers() const {
  FixedCapacityVector<log::sink_ptr, 2> sinks;

  if (_consoleLevel != log::level::off) {
    auto &consoleSink = sinks.emplace_back(std::make_shared<log::sinks::stderr_color_sink_mt>());
    consoleSink->set_level(_consoleLevel);
  }

  if (_fileLevel != log::level::off) {
    const File logFile(_dataDir, File::Type::kLog, kLogFileName, File::IfError::kNoThrow);
    log::filename_t logFileName(logFile.filePath());
    auto &rotatingSink = sinks.emplace_back(std::make_shared<log::sinks::rotating_file_sink_mt>(
        std::move(logFileName), static_cast<std::size_t>(_maxFileSizeLogFileInBytes),
        static_cast<std::size_t>(_maxNbLogFiles)));
    rotatingSink->set_level(_fileLevel);
  }

  log::init_thread_pool(kAsyncQueueSize, kNbLoggerThreads);

  if (sinks.empty()) {
    log::set_level(log::level::off);
  } else {
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);

    // each sink filters its own level, the logger level lets through the most verbose of both
    logger->set_level(std::min(_consoleLevel, _fileLevel));

    log::set_default_logger(std::move(logger));
  }

  CreateOutputLogger();
}

}  // namespace fxr
