#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace calltrace::util {

/*
  Time utilities.

  Call timestamps are wall clock (unix seconds, microsecond resolution);
  durations use the steady clock so they never go negative.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

double ToUnixSeconds(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

double ElapsedMillis(SteadyClock::time_point start, SteadyClock::time_point end);

// Local time as YYYYmmdd_HHMMSS, used for run file names.
std::string FormatRunStamp(TimePoint tp);

} // namespace calltrace::util
