#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace resync::util {

/*
  Background loop that runs a body every interval until stopped.

  Stop() wakes the sleeping thread and joins it, so shutdown never waits
  for a full interval. Exceptions escaping the body are logged and the
  loop continues with the next tick.
*/
class PeriodicTask {
 public:
  using Body = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  // Runs the body immediately, then once per interval.
  void Start();
  void Stop();

  bool IsRunning() const {
    return running_;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  Body                      body_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace resync::util
