#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

using TimePoint = std::chrono::system_clock::time_point;

/// Wall-clock source; injected so freshness and calendar logic can be tested
/// against simulated time.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock {
 public:
  TimePoint Now() const override {
    return std::chrono::system_clock::now();
  }
};

/// A clock that only moves when told to.
class ManualClock : public Clock {
 public:
  explicit ManualClock(TimePoint start) : now_{start} {
  }

  TimePoint Now() const override {
    std::lock_guard<std::mutex> lk(m_);
    return now_;
  }

  void Set(TimePoint t) {
    std::lock_guard<std::mutex> lk(m_);
    now_ = t;
  }

  template <typename Rep, typename Period>
  void Advance(std::chrono::duration<Rep, Period> d) {
    std::lock_guard<std::mutex> lk(m_);
    now_ += std::chrono::duration_cast<TimePoint::duration>(d);
  }

 private:
  mutable std::mutex m_;
  TimePoint now_;
};

inline std::int64_t ToEpochMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           t.time_since_epoch())
    .count();
}

inline TimePoint FromEpochMillis(std::int64_t ms) {
  return TimePoint{std::chrono::duration_cast<TimePoint::duration>(
    std::chrono::milliseconds{ms})};
}
