#pragma once

#include <cstdint>
#include <iterator>
#include <string_view>

namespace fxr {

/// Log level names ordered by position, from 0 (off) to 6 (trace).
inline constexpr std::string_view kLogLevelNames[] = {"off", "critical", "error", "warning", "info", "debug", "trace"};

inline constexpr int8_t kNbLogLevels = static_cast<int8_t>(std::size(kLogLevelNames));

/// Get the log level position (0 for off, 6 for trace) from its name, or its position in a string of one char.
/// Accepted names are off|critical|error|warning|info|debug|trace.
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace fxr
