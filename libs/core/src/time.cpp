#include "tollgate/core/time.h"

#include <cstdio>
#include <ctime>

namespace tollgate::core {

std::int64_t to_unix_ms(kj::Date date) {
  return (date - kj::UNIX_EPOCH) / kj::MILLISECONDS;
}

kj::String format_iso8601(kj::Date date) {
  auto ms = to_unix_ms(date);
  auto seconds = static_cast<std::time_t>(ms / 1000);
  auto millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    seconds -= 1;
    millis += 1000;
  }

  std::tm parts{};
  gmtime_r(&seconds, &parts);
  char buf[32];
  auto n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                         parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday, parts.tm_hour,
                         parts.tm_min, parts.tm_sec, millis);
  return kj::heapString(buf, static_cast<size_t>(n));
}

kj::String now_utc_iso8601() {
  return format_iso8601(kj::systemPreciseCalendarClock().now());
}

} // namespace tollgate::core
