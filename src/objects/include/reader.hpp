#pragma once

#include <string>

namespace fxr {

class Reader {
 public:
  Reader() noexcept = default;

  virtual ~Reader() = default;

  // Read all content and return a string of it.
  [[nodiscard]] virtual std::string readAll() const { return {}; }
};

}  // namespace fxr
