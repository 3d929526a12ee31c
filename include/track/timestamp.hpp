#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace track {

using Clock = std::chrono::system_clock;

// Source of "now"; tests substitute a fixed clock.
using NowFn = std::function<Clock::time_point()>;

// e.g. 2024-03-05 14:07:09 CET
constexpr const char* kTimeFormat = "%Y-%m-%d %H:%M:%S %Z";

// Formats t in the local time zone, truncated to whole seconds.
std::string format_timestamp(Clock::time_point t);

// Parses a timestamp written by format_timestamp. The zone abbreviation
// decides the offset: UTC/GMT, a numeric +hh[mm] offset, or one of the local
// zone's standard/daylight names. Any other abbreviation is taken as UTC.
bool parse_timestamp(const std::string& s, Clock::time_point& out);

std::string current_timestamp(const NowFn& now);

} // namespace track
