#pragma once

#include <algorithm>
#include <string_view>

#include "file.hpp"
#include "fxr_exception.hpp"
#include "fxr_json.hpp"
#include "fxr_log.hpp"
#include "reader.hpp"
#include "write-json.hpp"

namespace fxr {

/// Unknown keys are reported as errors.
static constexpr auto kExactJsonOptions =
    json::opts{.error_on_unknown_keys = true,  // NOLINT(readability-implicit-bool-conversion)
               .error_on_const_read = true,    // NOLINT(readability-implicit-bool-conversion)
               .raw_string = true};            // NOLINT(readability-implicit-bool-conversion)

/// Reads json content into outObject. Fields absent from the content keep their current value.
/// Empty content is accepted and leaves outObject untouched.
/// Throws exception on malformed content, after having logged the detailed parsing error.
template <json::opts opts = kExactJsonOptions>
void ReadJsonOrThrow(std::string_view strContent, auto &outObject) {
  if (strContent.empty()) {
    return;
  }

  const auto ec = json::read<opts>(outObject, strContent);
  if (ec) {
    log::error("Error while reading json content: {}", json::format_error(ec, strContent));

    static constexpr std::string_view::size_type kMaxPrefixLen = 20;
    const std::string_view prefix = strContent.substr(0, std::min(strContent.size(), kMaxPrefixLen));
    throw exception("Error while reading json content '{}{}'", prefix, prefix.size() < strContent.size() ? "..." : "");
  }
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(std::string_view strContent) {
  T outObject;
  ReadJsonOrThrow<opts>(strContent, outObject);
  return outObject;
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(const Reader &reader) {
  return ReadJsonOrThrow<T, opts>(reader.readAll());
}

/// Reads json content of given file if it exists, otherwise creates it with the default values of T.
template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrCreateFile(const File &file) {
  if (!file.exists()) {
    log::info("Creating {} with default values", file.filePath());
    T defaultObject;
    file.write(WritePrettyJsonOrThrow(defaultObject));
    return defaultObject;
  }
  return ReadJsonOrThrow<T, opts>(file);
}

}  // namespace fxr
