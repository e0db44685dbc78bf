#pragma once

#include <string>
#include <string_view>

#include "timedef.hpp"

namespace fxr {

/// Parse a calendar date in ISO 8601 format 'YYYY-MM-DD'.
/// Throws invalid_argument if the string is not a valid date (including impossible dates such as '2023-02-30').
Date StringToDate(std::string_view dateStr);

/// Writes chars of the ISO 8601 representation 'YYYY-MM-DD' of given date and return a pointer after the last char
/// written. The buffer should have a space of at least 10 chars.
char* DateToBuffer(Date date, char* buffer);

/// Get a string representation of given date in ISO 8601 format 'YYYY-MM-DD'.
std::string DateToString(Date date);

}  // namespace fxr
