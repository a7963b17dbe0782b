#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <squirrel/core/types.h>

namespace squirrel::core {

// UTC RFC 3339 with nine fractional digits, e.g. 2025-10-01T14:30:00.123456789Z.
// Lossless for system_clock on every supported platform.
std::string formatRfc3339(TimePoint tp);

// Accepts 0-9 fractional digits and a 'Z' or +HH:MM / -HH:MM offset.
Result<TimePoint> parseRfc3339(std::string_view text);

int64_t unixSeconds(TimePoint tp);
int64_t nowUnixSeconds();

} // namespace squirrel::core
