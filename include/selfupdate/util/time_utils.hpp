#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace selfupdate {

using TimePoint = std::chrono::system_clock::time_point;

// "2025-03-01T12:00:00Z"; always UTC, second precision.
std::string FormatRfc3339(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and a
// "Z" or "+hh:mm"/"-hh:mm" offset. Fractional seconds are truncated.
bool ParseRfc3339(std::string_view text, TimePoint& out);

// strftime() in the local time zone.
std::string FormatLocalTime(TimePoint tp, const char* fmt);

// "90s", "15m", "2h", "3d", "1w" and concatenations such as "1h30m".
bool ParseDuration(std::string_view text, std::chrono::seconds& out);

// Human readable "2h30m", "3d" etc.; used in CLI output.
std::string FormatDuration(std::chrono::seconds d);

} // namespace selfupdate
