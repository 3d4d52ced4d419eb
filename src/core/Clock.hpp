// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace dictum
{

using SystemTime = std::chrono::system_clock::time_point;

/// @brief Formats a point in time in the local time zone with strftime().
/// @param time The point in time, converted to the local time zone.
/// @param pattern A strftime() pattern such as "%Y-%m-%d".
[[nodiscard]] auto formatLocalTime(SystemTime time, std::string_view pattern) -> std::string;

/// @brief Returns "YYYYMMDD_HHMMSSmmm" in local time, used for artifact and history file names.
[[nodiscard]] auto compactTimestamp(SystemTime time) -> std::string;

/// @brief Returns ISO-8601 local time with milliseconds and UTC offset, e.g. "2025-03-01T14:05:09.120+01:00".
[[nodiscard]] auto isoTimestamp(SystemTime time) -> std::string;

} // namespace dictum
