#include "internal/lock/check_lock_client.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/check_lock_manager.hpp"
#include "internal/lock/static_authorizer.hpp"

namespace {

using namespace std::chrono_literals;
using namespace resync::v1;
using resync::connectivity::AuthorityKind;
using resync::connectivity::ConnectivityMonitor;
using resync::lock::CheckLockClient;
using resync::lock::CheckLockManager;
using resync::util::ManualClock;

std::shared_ptr<CheckLockManager> MakeManager(const std::shared_ptr<ManualClock>& clock) {
  auto authorizer = std::make_shared<resync::lock::StaticAuthorizer>(std::vector<resync::lock::Credential>{{"mgr-1", "4321"}});
  return std::make_shared<CheckLockManager>(std::make_shared<resync::db::memory::MemoryRepository>(), clock, authorizer);
}

struct Fixture {
  std::shared_ptr<ManualClock>         clock   = std::make_shared<ManualClock>();
  std::shared_ptr<ConnectivityMonitor> monitor = std::make_shared<ConnectivityMonitor>(clock, resync::connectivity::MonitorOptions{});
  std::shared_ptr<CheckLockManager>    cloud   = MakeManager(clock);
  std::shared_ptr<CheckLockManager>    relay   = MakeManager(clock);
  std::shared_ptr<CheckLockManager>    local   = MakeManager(clock);

  Fixture() {
    monitor->AddAuthority("cloud", AuthorityKind::kCloud, nullptr, 1s);
    monitor->AddAuthority("relay_host", AuthorityKind::kRelayHost, nullptr, 1s);
    monitor->AddAuthority("printer", AuthorityKind::kPeripheral, nullptr, 1s);
  }

  void Set(bool cloud_ok, bool relay_ok, bool peripheral_ok) {
    // One success restores an authority; three misses drop it.
    for (int i = 0; i < 3; ++i) {
      monitor->RecordHeartbeat("cloud", cloud_ok, clock->Now());
      monitor->RecordHeartbeat("relay_host", relay_ok, clock->Now());
      monitor->RecordHeartbeat("printer", peripheral_ok, clock->Now());
    }
  }
};

AcquireLockRequest ActiveRequest(const std::string& check_id, const std::string& requester) {
  AcquireLockRequest req;
  req.set_check_id(check_id);
  req.set_requester_id(requester);
  req.set_lock_type(LOCK_TYPE_ACTIVE);
  return req;
}

bool Held(const std::shared_ptr<CheckLockManager>& manager, const std::string& check_id) {
  GetLockStatusRequest req;
  req.set_check_id(check_id);
  return manager->GetLockStatus(req).lock().locked();
}

void TestRoutesByMode() {
  Fixture         f;
  CheckLockClient client(f.monitor, f.cloud, f.relay, f.local);

  f.Set(true, true, true);
  assert(f.monitor->Mode() == CONNECTION_MODE_ONLINE);
  auto resp = client.Acquire(ActiveRequest("chk-online", "t1"));
  assert(resp.outcome() == ACQUIRE_OUTCOME_GRANTED);
  assert(!resp.local_only());
  assert(Held(f.cloud, "chk-online"));
  assert(!Held(f.relay, "chk-online"));

  f.Set(false, true, true);
  assert(f.monitor->Mode() == CONNECTION_MODE_LAN_DEGRADED);
  resp = client.Acquire(ActiveRequest("chk-lan", "t1"));
  assert(!resp.local_only());
  assert(Held(f.relay, "chk-lan"));

  f.Set(false, false, true);
  assert(f.monitor->Mode() == CONNECTION_MODE_LOCAL_ONLY);
  resp = client.Acquire(ActiveRequest("chk-local", "t1"));
  assert(resp.outcome() == ACQUIRE_OUTCOME_GRANTED);
  assert(resp.local_only());
  assert(Held(f.local, "chk-local"));

  f.Set(false, false, false);
  assert(f.monitor->Mode() == CONNECTION_MODE_ISOLATED);
  resp = client.Acquire(ActiveRequest("chk-isolated", "t1"));
  assert(resp.local_only());
  assert(Held(f.local, "chk-isolated"));
}

void TestMissingRemoteFallsBackToLocal() {
  Fixture         f;
  CheckLockClient client(f.monitor, nullptr, nullptr, f.local);

  f.Set(true, true, true);
  const auto resp = client.Acquire(ActiveRequest("chk-1", "t1"));
  assert(resp.local_only());
  assert(Held(f.local, "chk-1"));
}

void TestReleaseFollowsRoute() {
  Fixture         f;
  CheckLockClient client(f.monitor, f.cloud, f.relay, f.local);

  f.Set(false, true, false);
  client.Acquire(ActiveRequest("chk-1", "t1"));

  ReleaseLockRequest release;
  release.set_check_id("chk-1");
  release.set_holder_id("t1");
  assert(client.Release(release).released());
  assert(!Held(f.relay, "chk-1"));
}

} // namespace

int main() {
  TestRoutesByMode();
  TestMissingRemoteFallsBackToLocal();
  TestReleaseFollowsRoute();

  std::cout << "resync_unit_check_lock_client: pass\n";
  return 0;
}
