#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace xrdinfo {

using TimePoint = std::chrono::system_clock::time_point;

// Parse an ISO 8601 date-time as written in configuration headers:
//   2024-05-01T10:00:00Z
//   2024-05-01T10:00:00.250+03:00
//   2024-05-01 10:00:00       (no zone: UTC)
// Returns nullopt for anything else.
std::optional<TimePoint> ParseIso8601(std::string_view text);

// Format as "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
std::string FormatIso8601(TimePoint time);

} // namespace xrdinfo
