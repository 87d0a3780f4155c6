#include "recovery_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace resync::recovery {

using namespace resync::v1;

std::string_view EventName(RecoveryEvent event) {
  switch (event) {
    case RecoveryEvent::kStarting:
      return "starting";
    case RecoveryEvent::kStarted:
      return "started";
    case RecoveryEvent::kStopped:
      return "stopped";
    case RecoveryEvent::kFailed:
      return "failed";
    case RecoveryEvent::kDegraded:
      return "degraded";
    case RecoveryEvent::kRecovering:
      return "recovering";
    case RecoveryEvent::kRecovered:
      return "recovered";
    case RecoveryEvent::kRecoveryExhausted:
      return "recovery_exhausted";
  }
  return "unknown";
}

RecoveryManager::RecoveryManager(std::shared_ptr<util::Clock> clock, RecoveryOptions options) : clock_(std::move(clock)), options_(options) {
  if (!clock_) throw std::invalid_argument("RecoveryManager requires a clock");
  if (options_.max_recovery_attempts > kMaxRecoveryAttempts) {
    throw util::InvalidArgument("max_recovery_attempts is capped at " + std::to_string(kMaxRecoveryAttempts));
  }
}

RecoveryManager::~RecoveryManager() {
  StopHealthChecks();
}

void RecoveryManager::RegisterService(SupervisedService service) {
  if (service.name.empty()) throw util::InvalidArgument("service name is required");
  if (!service.start || !service.stop) throw util::InvalidArgument("service " + service.name + " needs start and stop");

  std::lock_guard lock(state_mutex_);
  if (entries_.contains(service.name)) throw util::AlreadyExists("service " + service.name + " already registered");

  const auto name = service.name;
  Entry      entry;
  entry.breaker = std::make_unique<CircuitBreaker>(name, clock_, options_.circuit_breaker);
  entry.service = std::move(service);
  entries_.emplace(name, std::move(entry));
  order_.push_back(name);
}

void RecoveryManager::SetEventHandler(EventHandler handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = std::move(handler);
}

RecoveryManager::Entry& RecoveryManager::Find(const std::string& name) {
  std::lock_guard lock(state_mutex_);
  auto            it = entries_.find(name);
  if (it == entries_.end()) throw util::NotFound("service " + name + " not registered");
  return it->second;
}

const RecoveryManager::Entry& RecoveryManager::Find(const std::string& name) const {
  std::lock_guard lock(state_mutex_);
  auto            it = entries_.find(name);
  if (it == entries_.end()) throw util::NotFound("service " + name + " not registered");
  return it->second;
}

void RecoveryManager::SetState(Entry& entry, ServiceState state, const std::string& error) {
  std::lock_guard lock(state_mutex_);
  entry.state = state;
  if (!error.empty()) entry.last_error = error;
}

void RecoveryManager::Emit(const std::string& service, RecoveryEvent event, const std::string& detail) {
  observability::Metrics::Instance().RecordRecoveryEvent(service, EventName(event));

  EventHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = handler_;
  }
  if (!handler) return;

  try {
    handler(ServiceEvent{service, event, detail, clock_->Now()});
  } catch (const std::exception& e) {
    RESYNC_LOG_ERROR("Recovery event handler threw", {observability::StringField("service", service),
                                                      observability::StringField("event", EventName(event)),
                                                      observability::StringField("error", e.what())});
  }
}

void RecoveryManager::StartLocked(Entry& entry) {
  const auto& name = entry.service.name;

  SetState(entry, SERVICE_STATE_STARTING);
  Emit(name, RecoveryEvent::kStarting);

  try {
    entry.breaker->Execute(entry.service.start);
  } catch (const std::exception& e) {
    SetState(entry, SERVICE_STATE_FAILED, e.what());
    Emit(name, RecoveryEvent::kFailed, e.what());
    RESYNC_LOG_ERROR("Service failed to start", {observability::StringField("service", name), observability::StringField("error", e.what())});
    throw;
  }

  {
    std::lock_guard lock(state_mutex_);
    entry.state   = SERVICE_STATE_RUNNING;
    entry.started = true;
  }
  Emit(name, RecoveryEvent::kStarted);
  RESYNC_LOG_INFO("Service started", {observability::StringField("service", name)});
}

void RecoveryManager::StopLocked(Entry& entry) {
  const auto& name = entry.service.name;

  try {
    entry.service.stop();
  } catch (const std::exception& e) {
    SetState(entry, SERVICE_STATE_FAILED, e.what());
    Emit(name, RecoveryEvent::kFailed, e.what());
    throw;
  }

  SetState(entry, SERVICE_STATE_STOPPED);
  Emit(name, RecoveryEvent::kStopped);
}

void RecoveryManager::StartService(const std::string& name) {
  auto&           entry = Find(name);
  std::lock_guard ops(*entry.ops);
  if (entry.state == SERVICE_STATE_RUNNING) return;

  {
    std::lock_guard lock(state_mutex_);
    entry.exhausted = false;
    entry.attempts  = 0;
  }
  StartLocked(entry);
}

void RecoveryManager::StopService(const std::string& name) {
  auto&           entry = Find(name);
  std::lock_guard ops(*entry.ops);
  if (entry.state == SERVICE_STATE_STOPPED) return;

  {
    std::lock_guard lock(state_mutex_);
    entry.started = false;
  }
  StopLocked(entry);
}

void RecoveryManager::StartAll() {
  std::vector<std::string> names;
  {
    std::lock_guard lock(state_mutex_);
    names = order_;
  }

  for (const auto& name : names) {
    try {
      StartService(name);
    } catch (const std::exception& e) {
      RESYNC_LOG_ERROR("Continuing after service start failure",
                       {observability::StringField("service", name), observability::StringField("error", e.what())});
    }
  }
}

void RecoveryManager::StopAll() {
  std::vector<std::string> names;
  {
    std::lock_guard lock(state_mutex_);
    names.assign(order_.rbegin(), order_.rend());
  }

  for (const auto& name : names) {
    try {
      StopService(name);
    } catch (const std::exception& e) {
      RESYNC_LOG_ERROR("Service failed to stop", {observability::StringField("service", name), observability::StringField("error", e.what())});
    }
  }
}

void RecoveryManager::CheckHealth() {
  std::vector<std::string> names;
  {
    std::lock_guard lock(state_mutex_);
    names = order_;
  }

  for (const auto& name : names) {
    auto& entry = Find(name);

    bool needs_recovery = false;
    {
      std::lock_guard ops(*entry.ops);
      if (!entry.started || entry.exhausted || entry.recovering) continue;

      if (entry.state != SERVICE_STATE_RUNNING) {
        // a previous recovery attempt left it down
        needs_recovery = true;
      } else {
        bool        healthy = true;
        std::string error;
        try {
          healthy = !entry.service.health_check || entry.service.health_check();
        } catch (const std::exception& e) {
          healthy = false;
          error   = e.what();
        }

        if (healthy) {
          std::lock_guard lock(state_mutex_);
          entry.attempts = 0;
          continue;
        }

        if (!error.empty()) {
          SetState(entry, SERVICE_STATE_FAILED, error);
          Emit(name, RecoveryEvent::kFailed, error);
          RESYNC_LOG_WARN("Health check threw", {observability::StringField("service", name), observability::StringField("error", error)});
        } else {
          SetState(entry, SERVICE_STATE_DEGRADED);
          Emit(name, RecoveryEvent::kDegraded);
          RESYNC_LOG_WARN("Service unhealthy", {observability::StringField("service", name)});
        }
        needs_recovery = true;
      }
    }

    if (needs_recovery && options_.auto_recovery) Recover(entry);
  }
}

bool RecoveryManager::RecoverService(const std::string& name) {
  return Recover(Find(name));
}

bool RecoveryManager::Recover(Entry& entry) {
  const auto& name    = entry.service.name;
  uint32_t    attempt = 0;
  {
    std::lock_guard ops(*entry.ops);
    if (entry.exhausted || entry.recovering) return false;

    if (entry.attempts >= options_.max_recovery_attempts) {
      {
        std::lock_guard lock(state_mutex_);
        entry.exhausted = true;
        entry.state     = SERVICE_STATE_FAILED;
      }
      Emit(name, RecoveryEvent::kRecoveryExhausted, entry.last_error);
      RESYNC_LOG_ERROR("Service recovery exhausted", {observability::StringField("service", name),
                                                      observability::IntField("attempts", entry.attempts),
                                                      observability::StringField("last_error", entry.last_error)});
      return false;
    }

    {
      std::lock_guard lock(state_mutex_);
      attempt = ++entry.attempts;
    }
    entry.recovering = true;
  }

  const auto backoff = options_.recovery_backoff * (int64_t{1} << (attempt - 1));
  Emit(name, RecoveryEvent::kRecovering, "attempt " + std::to_string(attempt));
  RESYNC_LOG_WARN("Recovering service", {observability::StringField("service", name), observability::IntField("attempt", attempt),
                                         observability::DurationField("backoff", backoff)});
  clock_->SleepFor(backoff);

  std::lock_guard ops(*entry.ops);
  entry.recovering = false;
  if (!entry.started) {
    RESYNC_LOG_INFO("Recovery cancelled; service was stopped", {observability::StringField("service", name)});
    return false;
  }

  try {
    entry.service.stop();
  } catch (const std::exception& e) {
    RESYNC_LOG_WARN("Stop during recovery failed", {observability::StringField("service", name), observability::StringField("error", e.what())});
  }

  try {
    StartLocked(entry);
  } catch (const std::exception&) {
    // StartLocked recorded the error and emitted failed
    return false;
  }

  {
    std::lock_guard lock(state_mutex_);
    entry.last_recovery = clock_->Now();
  }
  Emit(name, RecoveryEvent::kRecovered, "attempt " + std::to_string(attempt));
  return true;
}

void RecoveryManager::StartHealthChecks() {
  if (health_task_) return;
  health_task_ = std::make_unique<util::PeriodicTask>("health-check", options_.health_check_interval, [this] { CheckHealth(); });
  health_task_->Start();
}

void RecoveryManager::StopHealthChecks() {
  if (!health_task_) return;
  health_task_->Stop();
  health_task_.reset();
}

ServiceState RecoveryManager::GetServiceState(const std::string& name) const {
  const auto&     entry = Find(name);
  std::lock_guard lock(state_mutex_);
  return entry.state;
}

std::map<std::string, ServiceState> RecoveryManager::GetAllStates() const {
  std::lock_guard lock(state_mutex_);

  std::map<std::string, ServiceState> states;
  for (const auto& [name, entry] : entries_) states[name] = entry.state;
  return states;
}

std::vector<ServiceStats> RecoveryManager::GetServiceStats() const {
  std::lock_guard lock(state_mutex_);

  std::vector<ServiceStats> stats;
  for (const auto& name : order_) {
    const auto&  entry = entries_.at(name);
    ServiceStats s;
    s.set_name(name);
    s.set_state(entry.state);
    s.set_last_error(entry.last_error);
    s.set_recovery_attempts(entry.attempts);
    s.set_last_recovery_ms(entry.last_recovery == util::TimePoint{} ? 0 : util::ToUnixMillis(entry.last_recovery));
    s.set_circuit_state(entry.breaker->State());
    s.set_circuit_failures(entry.breaker->Failures());
    s.set_exhausted(entry.exhausted);
    stats.push_back(std::move(s));
  }
  return stats;
}

} // namespace resync::recovery
