#pragma once

#include <chrono>

namespace fxr {

/// Rates are published per calendar day, without any time component. A Date is a number of days since Unix epoch,
/// which makes day arithmetic (date - days(1)) exact.
using Clock = std::chrono::system_clock;
using Date = std::chrono::sys_days;
using days = std::chrono::days;

/// Get the current date in UTC.
inline Date Today() { return std::chrono::floor<days>(Clock::now()); }

}  // namespace fxr
