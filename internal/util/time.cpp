#include "time.hpp"

#include <ctime>
#include <cstdio>

namespace tsbatch::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatCompactUtc(TimePoint tp) {
  const auto        sec    = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - sec).count();
  const std::time_t t      = Clock::to_time_t(sec);

  std::tm utc{};
  gmtime_r(&t, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d%03d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buf;
}

} // namespace tsbatch::util
