#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Clock.hpp"
#include "Metrics.hpp"

using JobAction = std::function<void()>;

/// What a daily job does with the day when its action throws
enum class FailurePolicy {
  FireOnce,           // the day counts as fired; next attempt tomorrow
  RetryUntilSuccess,  // the day stays open; the next tick tries again
};

struct DailyJob {
  std::string id;
  std::string zone{"America/New_York"};
  // local hour before which the job does not fire, e.g. 9 for 09:00
  std::optional<int> not_before_hour;
  FailurePolicy policy{FailurePolicy::FireOnce};
  JobAction action;
};

struct MidnightJob {
  std::string id;
  std::string zone{"America/New_York"};
  bool run_on_start{false};
  JobAction action;
};

/// Drives recurring jobs from one thread. Daily jobs fire at most once per
/// local calendar day of their zone; midnight jobs fire at each local 00:00
/// and reschedule from the instant they fired, so DST shifts do not drift.
class CalendarScheduler {
 public:
  explicit CalendarScheduler(
    const Clock& clock,
    std::chrono::milliseconds tick_interval = std::chrono::minutes{10});
  ~CalendarScheduler();

  CalendarScheduler(const CalendarScheduler&) = delete;
  CalendarScheduler& operator=(const CalendarScheduler&) = delete;

  /// Plain ticker: `tick` runs on every scheduler tick.
  /// Ids must be non-empty and unique (std::invalid_argument otherwise).
  void Register(const std::string& id, JobAction tick);
  void RegisterDaily(DailyJob job);
  void RegisterMidnight(MidnightJob job);

  std::vector<std::string> ListJobs() const;

  /// Counts each action as "scheduler.run" ok/error; set before Start()
  void SetMetrics(Metrics* metrics) {
    metrics_ = metrics;
  }

  /// Starts the driver thread; the first tick runs immediately
  void Start();
  /// Stops and joins the driver thread; safe to call more than once
  void Stop();
  bool IsRunning() const;

  /// One pass over tickers and daily jobs at clock.Now(); returns how many
  /// actions ran
  size_t Tick();

  /// Fires midnight jobs whose instant has passed; returns how many ran
  size_t RunDueMidnightJobs();

  std::optional<std::string> GetLastFiredDateKey(const std::string& id) const;
  std::optional<TimePoint> GetNextRun(const std::string& id) const;

 private:
  enum class Kind { Ticker, Daily, Midnight };

  struct Job {
    Kind kind;
    std::string id;
    std::string zone;
    std::optional<int> not_before_hour;
    FailurePolicy policy{FailurePolicy::FireOnce};
    bool run_on_start{false};
    JobAction action;
    std::optional<std::string> last_fired_date_key;
    std::optional<TimePoint> next_run;
  };

  void Add(Job job);
  bool RunAction(const Job& job, const char* reason);
  void RunStartupJobs();
  void Drive();

  const Clock& clock_;
  const std::chrono::milliseconds tick_interval_;
  Metrics* metrics_{nullptr};

  mutable std::mutex m_;
  std::map<std::string, Job> jobs_;

  // serializes Tick()/RunDueMidnightJobs() so a day cannot be claimed twice
  std::mutex run_m_;

  mutable std::mutex stop_m_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  bool running_{false};
  std::thread driver_;
};
