#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace resync::util {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void PeriodicTask::Loop() {
  for (;;) {
    try {
      body_();
    } catch (const std::exception& e) {
      RESYNC_LOG_ERROR("Periodic task iteration failed",
                       {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      return;
    }
  }
}

} // namespace resync::util
