#include "internal/recovery/recovery_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace resync::v1;
using resync::recovery::RecoveryEvent;
using resync::recovery::RecoveryManager;
using resync::recovery::RecoveryOptions;
using resync::recovery::ServiceEvent;
using resync::recovery::SupervisedService;
using resync::util::ManualClock;

// SleepFor parks the caller until Release().
class GatedClock final : public resync::util::Clock {
 public:
  resync::util::TimePoint Now() const override { return resync::util::TimePoint{}; }

  void SleepFor(resync::util::Millis) override {
    std::unique_lock lock(mutex_);
    sleeping_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
  }

  void WaitUntilSleeping() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return sleeping_; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    sleeping_ = false;
  bool                    released_ = false;
};

struct FakeService {
  int  starts      = 0;
  int  stops       = 0;
  bool healthy     = true;
  bool fail_start  = false;
  bool throw_check = false;

  SupervisedService Supervised(const std::string& name) {
    return SupervisedService{
        .name = name,
        .start =
            [this] {
              ++starts;
              if (fail_start) throw std::runtime_error("bind failed");
            },
        .stop = [this] { ++stops; },
        .health_check =
            [this] {
              if (throw_check) throw std::runtime_error("health check crashed");
              return healthy;
            },
    };
  }
};

RecoveryOptions Options() {
  RecoveryOptions options;
  options.max_recovery_attempts = 3;
  options.recovery_backoff      = 1000ms;
  options.auto_recovery         = true;
  // Keep the breaker out of the way of recovery attempts.
  options.circuit_breaker.failure_threshold = 100;
  return options;
}

int Count(const std::vector<ServiceEvent>& events, const std::string& service, RecoveryEvent event) {
  int n = 0;
  for (const auto& e : events) {
    if (e.service == service && e.event == event) ++n;
  }
  return n;
}

void TestStartStopOrder() {
  auto            clock = std::make_shared<ManualClock>();
  RecoveryManager manager(clock, Options());

  std::vector<std::string> log;
  for (const auto* name : {"connectivity", "fiscal", "replay"}) {
    const std::string service = name;
    manager.RegisterService({.name = service, .start = [&log, service] { log.push_back("start " + service); },
                             .stop = [&log, service] { log.push_back("stop " + service); }, .health_check = {}});
  }

  manager.StartAll();
  manager.StopAll();
  assert((log == std::vector<std::string>{"start connectivity", "start fiscal", "start replay", "stop replay", "stop fiscal",
                                          "stop connectivity"}));
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_STOPPED);

  bool duplicate = false;
  try {
    manager.RegisterService({.name = "fiscal", .start = [] {}, .stop = [] {}, .health_check = {}});
  } catch (const resync::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);
}

void TestStartFailureIsIsolated() {
  auto            clock = std::make_shared<ManualClock>();
  RecoveryManager manager(clock, Options());

  FakeService broken;
  FakeService fine;
  broken.fail_start = true;
  manager.RegisterService(broken.Supervised("broken"));
  manager.RegisterService(fine.Supervised("fine"));

  manager.StartAll();
  assert(manager.GetServiceState("broken") == SERVICE_STATE_FAILED);
  assert(manager.GetServiceState("fine") == SERVICE_STATE_RUNNING);

  // Initial start failures are not auto-recovered.
  manager.CheckHealth();
  assert(broken.starts == 1);
  assert(clock->Sleeps().empty());
}

void TestRecoveryBackoffAndExhaustion() {
  auto            clock = std::make_shared<ManualClock>();
  RecoveryManager manager(clock, Options());

  std::vector<ServiceEvent> events;
  manager.SetEventHandler([&](const ServiceEvent& event) { events.push_back(event); });

  FakeService sick;
  FakeService well;
  manager.RegisterService(sick.Supervised("replay"));
  manager.RegisterService(well.Supervised("fiscal"));
  manager.StartAll();

  sick.healthy = false;
  for (int i = 0; i < 6; ++i) manager.CheckHealth();

  assert((clock->Sleeps() == std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 4000ms}));
  assert(sick.starts == 4);
  assert(Count(events, "replay", RecoveryEvent::kRecovering) == 3);
  assert(Count(events, "replay", RecoveryEvent::kRecoveryExhausted) == 1);
  assert(manager.GetServiceState("replay") == SERVICE_STATE_FAILED);
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_RUNNING);
  assert(well.starts == 1);

  const auto stats = manager.GetServiceStats();
  assert(stats.size() == 2);
  assert(stats[0].name() == "replay");
  assert(stats[0].exhausted());
  assert(stats[0].recovery_attempts() == 3);
  assert(!stats[1].exhausted());

  // An explicit restart clears exhaustion.
  sick.healthy = true;
  manager.StopService("replay");
  manager.StartService("replay");
  manager.CheckHealth();
  assert(manager.GetServiceState("replay") == SERVICE_STATE_RUNNING);
  assert(!manager.GetServiceStats()[0].exhausted());
}

void TestHealthyCheckResetsAttempts() {
  auto            clock = std::make_shared<ManualClock>();
  RecoveryManager manager(clock, Options());

  FakeService flaky;
  manager.RegisterService(flaky.Supervised("connectivity"));
  manager.StartService("connectivity");

  flaky.throw_check = true;
  manager.CheckHealth();
  manager.CheckHealth();
  assert(manager.GetServiceStats()[0].recovery_attempts() == 2);
  assert(manager.GetServiceStats()[0].last_error() == "health check crashed");

  flaky.throw_check = false;
  manager.CheckHealth();
  assert(manager.GetServiceStats()[0].recovery_attempts() == 0);

  flaky.healthy = false;
  manager.CheckHealth();
  assert(clock->Sleeps().back() == 1000ms);
}

void TestHandlerErrorsAreContained() {
  auto            clock = std::make_shared<ManualClock>();
  RecoveryManager manager(clock, Options());
  manager.SetEventHandler([](const ServiceEvent&) { throw std::runtime_error("handler bug"); });

  FakeService service;
  manager.RegisterService(service.Supervised("fiscal"));
  manager.StartService("fiscal");
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_RUNNING);
}

void TestManualRecovery() {
  auto            clock   = std::make_shared<ManualClock>();
  auto            options = Options();
  options.auto_recovery   = false;
  RecoveryManager manager(clock, options);

  FakeService service;
  manager.RegisterService(service.Supervised("fiscal"));
  manager.StartService("fiscal");

  service.healthy = false;
  manager.CheckHealth();
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_DEGRADED);
  assert(service.starts == 1);

  assert(manager.RecoverService("fiscal"));
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_RUNNING);
  assert(service.stops == 1);
  assert(service.starts == 2);
}

void TestBackoffLeavesOtherServicesAlone() {
  auto            clock   = std::make_shared<GatedClock>();
  auto            options = Options();
  options.auto_recovery   = false;
  RecoveryManager manager(clock, options);

  std::vector<ServiceEvent> events;
  std::mutex                events_mutex;
  manager.SetEventHandler([&](const ServiceEvent& event) {
    std::lock_guard lock(events_mutex);
    events.push_back(event);
  });

  FakeService sick;
  FakeService well;
  manager.RegisterService(sick.Supervised("replay"));
  manager.RegisterService(well.Supervised("fiscal"));
  manager.StartAll();

  sick.healthy = false;
  manager.CheckHealth();
  assert(manager.GetServiceState("replay") == SERVICE_STATE_DEGRADED);

  bool        recovered = true;
  std::thread recovery([&] { recovered = manager.RecoverService("replay"); });
  clock->WaitUntilSleeping();

  // replay is in its backoff; fiscal is still checked and stoppable
  well.healthy = false;
  manager.CheckHealth();
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_DEGRADED);
  manager.StopService("fiscal");
  assert(manager.GetServiceState("fiscal") == SERVICE_STATE_STOPPED);
  assert(well.stops == 1);

  // a second attempt on the same service does not stack up
  assert(!manager.RecoverService("replay"));

  // stopping replay during its backoff cancels the restart
  manager.StopService("replay");
  clock->Release();
  recovery.join();

  assert(!recovered);
  assert(sick.starts == 1);
  assert(sick.stops == 1);
  assert(manager.GetServiceState("replay") == SERVICE_STATE_STOPPED);
  std::lock_guard lock(events_mutex);
  assert(Count(events, "replay", RecoveryEvent::kRecovering) == 1);
  assert(Count(events, "replay", RecoveryEvent::kRecovered) == 0);
}

void TestAttemptLimitIsBounded() {
  auto clock                    = std::make_shared<ManualClock>();
  auto options                  = Options();
  options.max_recovery_attempts = resync::recovery::kMaxRecoveryAttempts + 1;

  bool rejected = false;
  try {
    RecoveryManager manager(clock, options);
  } catch (const resync::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  // the largest allowed limit still produces a finite backoff
  options.max_recovery_attempts = resync::recovery::kMaxRecoveryAttempts;
  RecoveryManager manager(clock, options);
  FakeService     sick;
  manager.RegisterService(sick.Supervised("replay"));
  manager.StartService("replay");
  sick.healthy = false;
  for (uint32_t i = 0; i <= resync::recovery::kMaxRecoveryAttempts; ++i) manager.CheckHealth();

  assert(clock->Sleeps().size() == resync::recovery::kMaxRecoveryAttempts);
  assert(clock->Sleeps().back() == 1000ms * (int64_t{1} << (resync::recovery::kMaxRecoveryAttempts - 1)));
  assert(manager.GetServiceStats()[0].exhausted());
}

} // namespace

int main() {
  TestStartStopOrder();
  TestStartFailureIsIsolated();
  TestRecoveryBackoffAndExhaustion();
  TestHealthyCheckResetsAttempts();
  TestHandlerErrorsAreContained();
  TestManualRecovery();
  TestBackoffLeavesOtherServicesAlone();
  TestAttemptLimitIsBounded();

  std::cout << "resync_unit_recovery_manager: pass\n";
  return 0;
}
