#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "reader.hpp"
#include "writer.hpp"

namespace fxr {

class File : public Reader, public Writer {
 public:
  enum class Type : int8_t { kLog, kStatic };
  enum class IfError : int8_t { kThrow, kNoThrow };

  /// Creates a File from a full path.
  File(std::string_view filePath, IfError ifError);

  /// Creates a File located in the sub directory of 'dataDir' corresponding to given type.
  File(std::string_view dataDir, Type type, std::string_view name, IfError ifError);

  [[nodiscard]] std::string readAll() const override;

  int write(std::string_view data, Writer::Mode mode = Writer::Mode::FromStart) const override;

  [[nodiscard]] bool exists() const;

  [[nodiscard]] std::string_view filePath() const { return _filePath; }

 private:
  std::string _filePath;
  IfError _ifError;
};

}  // namespace fxr
