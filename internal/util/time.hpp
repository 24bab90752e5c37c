#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tsbatch::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// UTC "yyyyMMddTHHmmssSSS", sortable and safe for file names.
std::string FormatCompactUtc(TimePoint tp);

} // namespace tsbatch::util
