#include "internal/connectivity/connectivity_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/connectivity/terminal_presence.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using resync::connectivity::AuthorityKind;
using resync::connectivity::ConnectivityMonitor;
using resync::connectivity::MonitorOptions;
using resync::util::ManualClock;
using namespace resync::v1;

class ScriptedSender final : public resync::connectivity::HeartbeatSender {
 public:
  bool Heartbeat(std::chrono::milliseconds) override {
    ++calls;
    if (throws) throw std::runtime_error("connection refused");
    return ok;
  }

  bool ok     = true;
  bool throws = false;
  int  calls  = 0;
};

std::shared_ptr<ConnectivityMonitor> MakeMonitor(const std::shared_ptr<ManualClock>& clock) {
  return std::make_shared<ConnectivityMonitor>(clock, MonitorOptions{.missed_heartbeat_threshold = 3, .heartbeat_timeout = 100ms});
}

void TestModePrecedence() {
  using resync::connectivity::ComputeMode;
  assert(ComputeMode(true, true, true) == CONNECTION_MODE_ONLINE);
  assert(ComputeMode(true, false, false) == CONNECTION_MODE_ONLINE);
  assert(ComputeMode(false, true, true) == CONNECTION_MODE_LAN_DEGRADED);
  assert(ComputeMode(false, false, true) == CONNECTION_MODE_LOCAL_ONLY);
  assert(ComputeMode(false, false, false) == CONNECTION_MODE_ISOLATED);
}

void TestStartsIsolated() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);
  monitor->AddAuthority("cloud", AuthorityKind::kCloud, nullptr, 1s);
  assert(monitor->Mode() == CONNECTION_MODE_ISOLATED);
}

void TestLossIsDebouncedAndRecoveryImmediate() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);
  monitor->AddAuthority("cloud", AuthorityKind::kCloud, nullptr, 1s);
  monitor->AddAuthority("relay_host", AuthorityKind::kRelayHost, nullptr, 1s);

  std::vector<ConnectionMode> transitions;
  monitor->Subscribe([&](const ConnectivityStatus& status) { transitions.push_back(status.mode()); });

  monitor->RecordHeartbeat("cloud", true, clock->Now());
  monitor->RecordHeartbeat("relay_host", true, clock->Now());
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);

  monitor->RecordHeartbeat("cloud", false, clock->Now());
  monitor->RecordHeartbeat("cloud", false, clock->Now());
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);

  monitor->RecordHeartbeat("cloud", false, clock->Now());
  assert(monitor->Mode() == CONNECTION_MODE_LAN_DEGRADED);
  assert(!monitor->Snapshot()->cloud_reachable());
  assert(monitor->Snapshot()->relay_host_reachable());

  monitor->RecordHeartbeat("cloud", true, clock->Now());
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);

  // Only mode changes notify.
  assert((transitions == std::vector<ConnectionMode>{CONNECTION_MODE_ONLINE, CONNECTION_MODE_LAN_DEGRADED, CONNECTION_MODE_ONLINE}));
}

void TestMissCounterResetsOnSuccess() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);
  monitor->AddAuthority("cloud", AuthorityKind::kCloud, nullptr, 1s);

  monitor->RecordHeartbeat("cloud", true, clock->Now());
  monitor->RecordHeartbeat("cloud", false, clock->Now());
  monitor->RecordHeartbeat("cloud", false, clock->Now());
  monitor->RecordHeartbeat("cloud", true, clock->Now());
  monitor->RecordHeartbeat("cloud", false, clock->Now());
  monitor->RecordHeartbeat("cloud", false, clock->Now());
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);
}

void TestTickSendsOnlyDueHeartbeats() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);
  auto cloud   = std::make_shared<ScriptedSender>();
  auto printer = std::make_shared<ScriptedSender>();
  monitor->AddAuthority("cloud", AuthorityKind::kCloud, cloud, 15s);
  monitor->AddAuthority("printer", AuthorityKind::kPeripheral, printer, 5s);

  monitor->Tick();
  assert(cloud->calls == 1 && printer->calls == 1);
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);

  clock->Advance(5s);
  monitor->Tick();
  assert(cloud->calls == 1 && printer->calls == 2);

  clock->Advance(10s);
  cloud->throws = true;
  monitor->Tick();
  assert(cloud->calls == 2);
  assert(monitor->Mode() == CONNECTION_MODE_ONLINE);

  for (int i = 0; i < 2; ++i) {
    clock->Advance(15s);
    monitor->Tick();
  }
  assert(monitor->Mode() == CONNECTION_MODE_LOCAL_ONLY);
  assert(monitor->Snapshot()->peripherals_reachable());
}

void TestSnapshotSequenceAdvances() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);
  monitor->AddAuthority("cloud", AuthorityKind::kCloud, nullptr, 1s);

  const auto before = monitor->Snapshot();
  monitor->RecordHeartbeat("cloud", true, clock->Now());
  const auto after = monitor->Snapshot();

  assert(after->sequence() > before->sequence());
  assert(before->mode() == CONNECTION_MODE_ISOLATED);
}

void TestUnknownAuthorityThrows() {
  auto clock   = std::make_shared<ManualClock>();
  auto monitor = MakeMonitor(clock);

  bool threw = false;
  try {
    monitor->RecordHeartbeat("nope", true, clock->Now());
  } catch (const resync::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestTerminalPresenceWindow() {
  resync::connectivity::TerminalPresence presence(10s, 3);
  const auto                             start = resync::util::TimePoint{} + 1h;

  assert(presence.RecordHeartbeat("t1", "10.0.0.21:50051", start));
  assert(!presence.RecordHeartbeat("t1", "", start + 10s));
  assert(presence.IsReachable("t1", start + 39s));
  assert(!presence.IsReachable("t1", start + 40s));
  assert(*presence.CallbackAddress("t1") == "10.0.0.21:50051");

  // Returning after the window counts as a reconnect.
  assert(presence.RecordHeartbeat("t1", "", start + 60s));
  assert(!presence.IsReachable("t2", start));
}

} // namespace

int main() {
  TestModePrecedence();
  TestStartsIsolated();
  TestLossIsDebouncedAndRecoveryImmediate();
  TestMissCounterResetsOnSuccess();
  TestTickSendsOnlyDueHeartbeats();
  TestSnapshotSequenceAdvances();
  TestUnknownAuthorityThrows();
  TestTerminalPresenceWindow();

  std::cout << "resync_unit_connectivity_monitor: pass\n";
  return 0;
}
