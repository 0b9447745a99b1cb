#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace codestaff::util {

/*
  Time utilities. Single place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);
int64_t NowUnixSeconds();

// "YYYY-MM-DD HH:MM" in UTC, used when rendering history rows.
std::string FormatUnixSeconds(int64_t seconds);

} // namespace codestaff::util
