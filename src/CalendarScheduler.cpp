#include "CalendarScheduler.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "ZoneTime.hpp"

#include <algorithm>
#include <stdexcept>

CalendarScheduler::CalendarScheduler(const Clock& clock,
                                     std::chrono::milliseconds tick_interval)
    : clock_{clock}, tick_interval_{tick_interval} {
  if (tick_interval_.count() <= 0) {
    throw std::invalid_argument("CalendarScheduler: tick interval must be > 0");
  }
}

CalendarScheduler::~CalendarScheduler() {
  Stop();
}

void CalendarScheduler::Register(const std::string& id, JobAction tick) {
  Job job;
  job.kind = Kind::Ticker;
  job.id = id;
  job.action = std::move(tick);
  Add(std::move(job));
}

void CalendarScheduler::RegisterDaily(DailyJob daily) {
  if (daily.not_before_hour &&
      (*daily.not_before_hour < 0 || *daily.not_before_hour > 23)) {
    throw std::invalid_argument("CalendarScheduler: hour out of range for " +
                                daily.id);
  }
  Job job;
  job.kind = Kind::Daily;
  job.id = std::move(daily.id);
  job.zone = std::move(daily.zone);
  job.not_before_hour = daily.not_before_hour;
  job.policy = daily.policy;
  job.action = std::move(daily.action);
  Add(std::move(job));
}

void CalendarScheduler::RegisterMidnight(MidnightJob midnight) {
  Job job;
  job.kind = Kind::Midnight;
  job.id = std::move(midnight.id);
  job.zone = std::move(midnight.zone);
  job.run_on_start = midnight.run_on_start;
  job.action = std::move(midnight.action);
  Add(std::move(job));
}

void CalendarScheduler::Add(Job job) {
  if (job.id.empty()) {
    throw std::invalid_argument("CalendarScheduler: job id is required");
  }
  if (!job.action) {
    throw std::invalid_argument("CalendarScheduler: " + job.id +
                                " has no action");
  }
  if (job.kind != Kind::Ticker && !zonetime::IsKnownZone(job.zone)) {
    throw ConfigError("unknown time zone '" + job.zone + "' for job " +
                      job.id);
  }
  if (job.kind == Kind::Midnight) {
    job.next_run = zonetime::NextMidnight(clock_.Now(), job.zone);
  }

  std::lock_guard<std::mutex> lk(m_);
  if (jobs_.count(job.id)) {
    throw std::invalid_argument("CalendarScheduler: already registered: " +
                                job.id);
  }
  logr::debug << "[CalendarScheduler] registered " << job.id;
  const std::string id = job.id;
  jobs_.emplace(id, std::move(job));
}

std::vector<std::string> CalendarScheduler::ListJobs() const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<std::string> ids;
  ids.reserve(jobs_.size());
  for (const auto& [id, job] : jobs_)
    ids.push_back(id);
  return ids;
}

bool CalendarScheduler::RunAction(const Job& job, const char* reason) {
  try {
    job.action();
    logr::debug << "[CalendarScheduler] " << job.id << " ran (" << reason
                << ")";
    if (metrics_)
      metrics_->IncrementSchedulerRun(job.id, "ok");
    return true;
  } catch (const std::exception& e) {
    logr::error << "[CalendarScheduler] " << job.id << " failed (" << reason
                << "): " << e.what();
    if (metrics_)
      metrics_->IncrementSchedulerRun(job.id, "error");
    return false;
  }
}

size_t CalendarScheduler::Tick() {
  std::lock_guard<std::mutex> run_lk(run_m_);
  const TimePoint now = clock_.Now();

  std::vector<Job> due;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& [id, job] : jobs_) {
      if (job.kind == Kind::Ticker) {
        due.push_back(job);
        continue;
      }
      if (job.kind != Kind::Daily)
        continue;

      if (job.not_before_hour &&
          zonetime::LocalHour(now, job.zone) < *job.not_before_hour)
        continue;
      const std::string date_key = zonetime::DateKey(now, job.zone);
      if (job.last_fired_date_key == date_key)
        continue;

      // FireOnce claims the day before running
      if (job.policy == FailurePolicy::FireOnce)
        job.last_fired_date_key = date_key;

      Job copy = job;
      copy.last_fired_date_key = date_key;
      due.push_back(std::move(copy));
    }
  }

  for (const auto& job : due) {
    const bool ok = RunAction(job, "tick");
    if (job.kind != Kind::Daily)
      continue;
    if (ok && job.policy == FailurePolicy::RetryUntilSuccess) {
      std::lock_guard<std::mutex> lk(m_);
      if (auto it = jobs_.find(job.id); it != jobs_.end())
        it->second.last_fired_date_key = job.last_fired_date_key;
    } else if (!ok) {
      if (job.policy == FailurePolicy::FireOnce)
        logr::warning << "[CalendarScheduler] " << job.id
                      << " marked fired for " << *job.last_fired_date_key
                      << " despite failure";
      else
        logr::warning << "[CalendarScheduler] " << job.id
                      << " will retry on the next tick";
    }
  }
  return due.size();
}

size_t CalendarScheduler::RunDueMidnightJobs() {
  std::lock_guard<std::mutex> run_lk(run_m_);
  const TimePoint now = clock_.Now();

  std::vector<Job> due;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& [id, job] : jobs_) {
      if (job.kind != Kind::Midnight || !job.next_run || *job.next_run > now)
        continue;
      job.next_run = zonetime::NextMidnight(now, job.zone);
      due.push_back(job);
    }
  }

  for (const auto& job : due)
    RunAction(job, "midnight");
  return due.size();
}

void CalendarScheduler::RunStartupJobs() {
  std::vector<Job> startup;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& [id, job] : jobs_) {
      if (job.kind == Kind::Midnight && job.run_on_start)
        startup.push_back(job);
    }
  }
  for (const auto& job : startup)
    RunAction(job, "startup");
}

std::optional<std::string> CalendarScheduler::GetLastFiredDateKey(
  const std::string& id) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second.last_fired_date_key;
}

std::optional<TimePoint> CalendarScheduler::GetNextRun(
  const std::string& id) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second.next_run;
}

void CalendarScheduler::Start() {
  std::lock_guard<std::mutex> lk(stop_m_);
  if (running_)
    return;
  stop_requested_ = false;
  running_ = true;
  driver_ = std::thread([this] { Drive(); });
  logr::info << "[CalendarScheduler] started, tick every "
             << std::chrono::duration_cast<std::chrono::seconds>(
                  tick_interval_)
                  .count()
             << "s";
}

void CalendarScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lk(stop_m_);
    if (!running_)
      return;
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
  if (driver_.joinable())
    driver_.join();
  std::lock_guard<std::mutex> lk(stop_m_);
  running_ = false;
  logr::info << "[CalendarScheduler] stopped";
}

bool CalendarScheduler::IsRunning() const {
  std::lock_guard<std::mutex> lk(stop_m_);
  return running_;
}

void CalendarScheduler::Drive() {
  using steady = std::chrono::steady_clock;
  using std::chrono::milliseconds;

  RunStartupJobs();

  auto next_tick = steady::now();
  while (true) {
    try {
      if (steady::now() >= next_tick) {
        Tick();
        next_tick = steady::now() + tick_interval_;
      }
      RunDueMidnightJobs();
    } catch (const std::exception& e) {
      logr::error << "[CalendarScheduler] driver error: " << e.what();
    }

    auto wait = std::chrono::duration_cast<milliseconds>(next_tick -
                                                         steady::now());
    {
      std::lock_guard<std::mutex> lk(m_);
      for (const auto& [id, job] : jobs_) {
        if (!job.next_run)
          continue;
        auto until = std::chrono::duration_cast<milliseconds>(
                       *job.next_run - clock_.Now()) +
                     milliseconds{1};
        wait = std::min(wait, until);
      }
    }
    wait = std::max(wait, milliseconds{0});

    std::unique_lock<std::mutex> lk(stop_m_);
    if (stop_cv_.wait_for(lk, wait, [this] { return stop_requested_; }))
      break;
  }
}
