#pragma once

#include <optional>
#include <string>

#include "CalendarScheduler.hpp"
#include "FreshnessCache.hpp"

struct DailySchedule {
  // local hour (in the configured zone) from which the refresh may run
  int after_hour{0};
  FailurePolicy policy{FailurePolicy::FireOnce};
};

/// One scraped page and how long its parsed payload stays fresh
struct Feed {
  std::string key;
  std::string path;
  Ttl ttl;
  // payload field that must be present and non-empty; empty: no check
  std::string require;
  std::optional<DailySchedule> daily;
  // unconditional refresh at each local midnight
  bool midnight{false};
};
