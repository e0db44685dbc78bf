#include "file.hpp"

#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include "fxr_exception.hpp"
#include "fxr_log.hpp"
#include "writer.hpp"

namespace fxr {
namespace {
std::string FullFileName(std::string_view dataDir, std::string_view fileName, File::Type fileType) {
  std::string fullFilePath(dataDir);
  switch (fileType) {
    case File::Type::kLog:
      fullFilePath.append("/log/");
      break;
    case File::Type::kStatic:
      fullFilePath.append("/static/");
      break;
  }
  fullFilePath.append(fileName);
  return fullFilePath;
}
}  // namespace

File::File(std::string_view filePath, IfError ifError) : _filePath(filePath), _ifError(ifError) {}

File::File(std::string_view dataDir, Type type, std::string_view name, IfError ifError)
    : _filePath(FullFileName(dataDir, name, type)), _ifError(ifError) {}

std::string File::readAll() const {
  log::debug("Opening file {} for reading", _filePath);
  std::string data;
  if (_ifError == IfError::kThrow || exists()) {
    std::ifstream file(_filePath);
    if (!file) {
      throw exception("Unable to open {} for reading", _filePath);
    }
    data = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
      if (_ifError == IfError::kThrow) {
        throw exception("Error while reading file {}", _filePath);
      }
      log::error("Error while reading file {}", _filePath);
      data.clear();
    }
  }
  return data;
}

int File::write(std::string_view data, Writer::Mode mode) const {
  if (data.empty()) {
    return 0;
  }
  log::debug("Opening file {} for writing", _filePath);

  // Parent directory (typically 'static' sub directory of data dir) may not exist yet
  const std::filesystem::path parentDir = std::filesystem::path(_filePath).parent_path();
  std::error_code ec;
  if (!parentDir.empty()) {
    std::filesystem::create_directories(parentDir, ec);
  }

  const auto openMode = mode == Writer::Mode::FromStart ? std::ios_base::out : std::ios_base::app;
  std::ofstream fileOfStream(_filePath, openMode);
  if (!fileOfStream) {
    if (_ifError == IfError::kThrow) {
      throw exception("Unable to open {} for writing", _filePath);
    }
    log::error("Unable to open {} for writing", _filePath);
    return 0;
  }
  fileOfStream << data << '\n';
  if (!fileOfStream) {
    if (_ifError == IfError::kThrow) {
      throw exception("Error while writing file {}", _filePath);
    }
    log::error("Error while writing file {}", _filePath);
    return 0;
  }
  return static_cast<int>(data.length()) + 1;
}

bool File::exists() const { return std::filesystem::exists(std::filesystem::path(_filePath)); }

}  // namespace fxr
