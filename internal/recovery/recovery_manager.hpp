#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "circuit_breaker.hpp"
#include "internal/util/periodic_task.hpp"
#include "internal/util/time.hpp"
#include "resync/v1/admin_service.pb.h"

namespace resync::recovery {

// A supervised component. health_check may be empty (always healthy).
struct SupervisedService {
  std::string           name;
  std::function<void()> start;
  std::function<void()> stop;
  std::function<bool()> health_check;
};

enum class RecoveryEvent {
  kStarting,
  kStarted,
  kStopped,
  kFailed,
  kDegraded,
  kRecovering,
  kRecovered,
  kRecoveryExhausted,
};

std::string_view EventName(RecoveryEvent event);

struct ServiceEvent {
  std::string     service;
  RecoveryEvent   event;
  std::string     detail;
  util::TimePoint at{};
};

// Backoff doubles per attempt; more attempts than this are rejected.
inline constexpr uint32_t kMaxRecoveryAttempts = 16;

struct RecoveryOptions {
  uint32_t                  max_recovery_attempts = 3;
  std::chrono::milliseconds recovery_backoff{1000};
  std::chrono::milliseconds health_check_interval{30000};
  bool                      auto_recovery = true;
  CircuitBreakerOptions     circuit_breaker;
};

/*
  Supervisor over named services.

  Health checks run on every running service. An unhealthy or throwing
  check triggers one recovery attempt (stop + start after an exponential
  backoff slept on the clock). Attempts reset only when a later health
  check passes; once max_recovery_attempts are spent the service is marked
  failed and exhausted, emits recovery_exhausted once and is left alone.
  Other services are unaffected.

  Lifecycle operations are serialized per service. The backoff sleep holds
  no lock, so other services keep being checked and a stop issued during
  the backoff cancels the attempt. The event handler runs on the calling
  thread and its exceptions are logged.
*/
class RecoveryManager {
 public:
  using EventHandler = std::function<void(const ServiceEvent&)>;

  RecoveryManager(std::shared_ptr<util::Clock> clock, RecoveryOptions options = {});
  ~RecoveryManager();

  RecoveryManager(const RecoveryManager&)            = delete;
  RecoveryManager& operator=(const RecoveryManager&) = delete;

  // Throws util::AlreadyExists for a duplicate name.
  void RegisterService(SupervisedService service);
  void SetEventHandler(EventHandler handler);

  // Rethrows the start error after recording it.
  void StartService(const std::string& name);
  void StopService(const std::string& name);

  // Registration order; failures are logged and the rest continue.
  void StartAll();
  // Reverse registration order.
  void StopAll();

  // One health-check pass.
  void CheckHealth();

  // One recovery attempt; returns true when the service is running again.
  bool RecoverService(const std::string& name);

  void StartHealthChecks();
  void StopHealthChecks();

  resync::v1::ServiceState                GetServiceState(const std::string& name) const;
  std::map<std::string, resync::v1::ServiceState> GetAllStates() const;
  std::vector<resync::v1::ServiceStats>   GetServiceStats() const;

 private:
  struct Entry {
    SupervisedService               service;
    std::unique_ptr<CircuitBreaker> breaker;
    resync::v1::ServiceState        state = resync::v1::SERVICE_STATE_STOPPED;
    std::string                     last_error;
    uint32_t                        attempts = 0;
    util::TimePoint                 last_recovery{};
    bool                            exhausted  = false;
    bool                            started    = false;
    bool                            recovering = false;

    // Held while this service's callbacks run.
    std::unique_ptr<std::mutex> ops = std::make_unique<std::mutex>();
  };

  Entry& Find(const std::string& name);
  const Entry& Find(const std::string& name) const;

  void SetState(Entry& entry, resync::v1::ServiceState state, const std::string& error = {});
  void Emit(const std::string& service, RecoveryEvent event, const std::string& detail = {});

  void StartLocked(Entry& entry);
  void StopLocked(Entry& entry);
  bool Recover(Entry& entry);

  std::shared_ptr<util::Clock> clock_;
  RecoveryOptions              options_;

  // Guards entries' observable state.
  mutable std::mutex           state_mutex_;
  std::map<std::string, Entry> entries_;
  std::vector<std::string>     order_;

  std::mutex   handler_mutex_;
  EventHandler handler_;

  std::unique_ptr<util::PeriodicTask> health_task_;
};

} // namespace resync::recovery
