#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace flowgraph::util {

/*
  Time utilities, single place to control clock source and wire format.
*/

TimePoint Now();

// RFC 3339 UTC with nanosecond precision: 2024-05-01T12:30:00.123456789Z
std::string FormatTimestamp(TimePoint tp);

// Accepts a 'Z' or +hh:mm / -hh:mm suffix and 0-9 fractional digits.
// @throws ValidationError on malformed input.
TimePoint ParseTimestamp(std::string_view text);

}  // namespace flowgraph::util
