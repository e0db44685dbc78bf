#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

#include "commandlineoption.hpp"

namespace fxr {

/// Compile time checker of command line options definitions:
///  - short hand flags are unique
///  - full names are unique
///  - descriptions are not empty, and neither start nor end with a space or a new line
template <class T, std::size_t N>
consteval bool StaticCommandLineOptionsCheck(const T (&options)[N]) {
  std::array<CommandLineOption, N> all;
  std::ranges::transform(options, all.begin(), [](const auto& optWithValue) { return optWithValue.first; });

  // std::bitset is unfortunately not constexpr in C++20
  uint64_t shortNamePresenceBmp[4]{};
  for (const CommandLineOption& commandLineOption : all) {
    if (commandLineOption.hasShortName()) {
      const auto shortNameChar = static_cast<uint8_t>(commandLineOption.shortNameChar());
      uint64_t& subBmp = shortNamePresenceBmp[shortNameChar / 64];
      const uint64_t bit = static_cast<uint64_t>(1) << (shortNameChar % 64);
      if ((subBmp & bit) != 0) {
        return false;
      }
      subBmp |= bit;
    }
  }

  std::ranges::sort(all, [](const auto& lhs, const auto& rhs) { return lhs.fullName() < rhs.fullName(); });
  if (std::ranges::adjacent_find(all, [](const auto& lhs, const auto& rhs) {
        return lhs.fullName() == rhs.fullName();
      }) != all.end()) {
    return false;
  }

  const auto isSpaceOrNewLine = [](char ch) { return ch == '\n' || ch == ' '; };
  return std::ranges::none_of(all, [&isSpaceOrNewLine](const CommandLineOption& commandLineOption) {
    const auto descr = commandLineOption.description();
    return descr.empty() || isSpaceOrNewLine(descr.front()) || isSpaceOrNewLine(descr.back());
  });
}

}  // namespace fxr
