#include "time.hpp"

#include <thread>

namespace resync::util {

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(ms));
}

TimePoint WallClock::Now() const {
  return SystemClock::now();
}

void WallClock::SleepFor(Millis duration) {
  std::this_thread::sleep_for(duration);
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::SleepFor(Millis duration) {
  std::lock_guard lock(mutex_);
  sleeps_.push_back(duration);
  now_ += duration;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

void ManualClock::Advance(Millis duration) {
  std::lock_guard lock(mutex_);
  now_ += duration;
}

std::vector<Millis> ManualClock::Sleeps() const {
  std::lock_guard lock(mutex_);
  return sleeps_;
}

} // namespace resync::util
