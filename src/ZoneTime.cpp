#include "ZoneTime.hpp"
#include "Errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <optional>

namespace {

// TZ is process-wide: every conversion swaps it in under this lock and
// restores the previous value afterwards.
std::mutex& tz_mutex() {
  static std::mutex m;
  return m;
}

class ScopedZone {
 public:
  explicit ScopedZone(const std::string& zone) : lock_{tz_mutex()} {
    if (const char* old = std::getenv("TZ"))
      previous_ = old;
    ::setenv("TZ", zone.c_str(), 1);
    ::tzset();
  }
  ~ScopedZone() {
    if (previous_)
      ::setenv("TZ", previous_->c_str(), 1);
    else
      ::unsetenv("TZ");
    ::tzset();
  }
  ScopedZone(const ScopedZone&) = delete;
  ScopedZone& operator=(const ScopedZone&) = delete;

 private:
  std::lock_guard<std::mutex> lock_;
  std::optional<std::string> previous_;
};

}  // namespace

namespace zonetime {

bool IsKnownZone(const std::string& zone) {
  if (zone.empty() || zone.find("..") != std::string::npos)
    return false;
  if (zone == "UTC")
    return true;
  const char* tzdir = std::getenv("TZDIR");
  const std::filesystem::path base = tzdir ? tzdir : "/usr/share/zoneinfo";
  std::error_code ec;
  return std::filesystem::is_regular_file(base / zone, ec);
}

ZonedParts ToZoned(TimePoint t, const std::string& zone) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  {
    ScopedZone scope(zone);
    if (!::localtime_r(&tt, &tm)) {
      throw ConfigError("cannot convert time into zone " + zone);
    }
  }
  return ZonedParts{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                    tm.tm_hour,        tm.tm_min,     tm.tm_sec};
}

TimePoint FromZoned(const ZonedParts& parts, const std::string& zone) {
  std::tm tm{};
  tm.tm_year = parts.year - 1900;
  tm.tm_mon = parts.month - 1;
  tm.tm_mday = parts.day;
  tm.tm_hour = parts.hour;
  tm.tm_min = parts.minute;
  tm.tm_sec = parts.second;
  tm.tm_isdst = -1;  // let the zone rules decide

  std::time_t tt;
  {
    ScopedZone scope(zone);
    tt = std::mktime(&tm);
  }
  if (tt == static_cast<std::time_t>(-1)) {
    throw ConfigError("cannot convert local time in zone " + zone);
  }
  return std::chrono::system_clock::from_time_t(tt);
}

std::string DateKey(TimePoint t, const std::string& zone) {
  const ZonedParts p = ToZoned(t, zone);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", p.year, p.month, p.day);
  return buf;
}

int LocalHour(TimePoint t, const std::string& zone) {
  return ToZoned(t, zone).hour;
}

TimePoint NextMidnight(TimePoint now, const std::string& zone) {
  const ZonedParts p = ToZoned(now, zone);
  const TimePoint today = FromZoned({p.year, p.month, p.day, 0, 0, 0}, zone);
  if (today > now)
    return today;
  // mktime rolls day+1 over month and year ends
  return FromZoned({p.year, p.month, p.day + 1, 0, 0, 0}, zone);
}

}  // namespace zonetime
