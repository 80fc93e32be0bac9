#pragma once

#include <cstdint>
#include <kj/string.h>
#include <kj/time.h>

namespace tollgate::core {

// Milliseconds since the Unix epoch for a calendar-clock reading.
[[nodiscard]] std::int64_t to_unix_ms(kj::Date date);

// UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z
[[nodiscard]] kj::String format_iso8601(kj::Date date);

// format_iso8601 of the system calendar clock.
[[nodiscard]] kj::String now_utc_iso8601();

} // namespace tollgate::core
