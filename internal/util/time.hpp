#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace resync::util {

/*
  Every component that reads the time or waits takes a Clock, so
  rollover, heartbeat expiry and recovery backoff can be driven from
  tests. Persisted timestamps are unix milliseconds.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;
using Millis      = std::chrono::milliseconds;

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  // Blocks the caller; ManualClock advances instead.
  virtual void SleepFor(Millis duration) = 0;
};

class WallClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(Millis duration) override;
};

/*
  Test clock. Time only moves through Advance() or SleepFor();
  every SleepFor() is recorded.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{});

  TimePoint Now() const override;
  void      SleepFor(Millis duration) override;

  void Set(TimePoint tp);
  void Advance(Millis duration);

  std::vector<Millis> Sleeps() const;

 private:
  mutable std::mutex  mutex_;
  TimePoint           now_;
  std::vector<Millis> sleeps_;
};

} // namespace resync::util
