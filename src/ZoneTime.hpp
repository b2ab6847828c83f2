#pragma once

#include <string>

#include "Clock.hpp"

/// Wall-clock fields of an instant in a named IANA zone
struct ZonedParts {
  int year{0};
  int month{0};  // 1-12
  int day{0};
  int hour{0};
  int minute{0};
  int second{0};
};

/// Conversions swap the process-wide TZ variable under a lock that only
/// these functions take. Other threads reading the environment (libcurl's
/// proxy lookup, for one) are not covered, so do not convert while a fetch
/// runs on another thread.
namespace zonetime {

/// True when tz data for `zone` is installed
bool IsKnownZone(const std::string& zone);

ZonedParts ToZoned(TimePoint t, const std::string& zone);

/// Instant for local wall time `parts` in `zone`; out-of-range fields
/// (day 32, hour 24) are normalized the way mktime does
TimePoint FromZoned(const ZonedParts& parts, const std::string& zone);

/// Local calendar date "YYYY-MM-DD" of `t` in `zone`
std::string DateKey(TimePoint t, const std::string& zone);

int LocalHour(TimePoint t, const std::string& zone);

/// The first local 00:00 in `zone` strictly after `now`
TimePoint NextMidnight(TimePoint now, const std::string& zone);

}  // namespace zonetime
