#include "internal/lock/check_lock_manager.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/conflict_merge.hpp"
#include "internal/lock/static_authorizer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace resync::v1;
using resync::db::memory::MemoryRepository;
using resync::db::model::CheckRecord;
using resync::lock::CheckLockManager;
using resync::util::ManualClock;

class FakeReachability final : public resync::lock::HolderReachability {
 public:
  bool IsReachable(const std::string& terminal_id, resync::util::TimePoint) const override {
    return reachable.contains(terminal_id);
  }

  std::set<std::string> reachable;
};

// Plays the holder terminal: acknowledges and releases its lock.
class FakeChannel final : public resync::lock::HolderChannel {
 public:
  bool RequestFlushAndRelease(const std::string& terminal_id, const std::string& check_id, std::chrono::milliseconds) override {
    ++requests;
    if (!acknowledge) return false;

    ReleaseLockRequest release;
    release.set_check_id(check_id);
    release.set_holder_id(terminal_id);
    manager->Release(release);
    return true;
  }

  CheckLockManager* manager     = nullptr;
  bool              acknowledge = true;
  int               requests    = 0;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repo         = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock        = std::make_shared<ManualClock>(resync::util::FromUnixMillis(1'767'600'000'000));
  std::shared_ptr<FakeReachability> reachability = std::make_shared<FakeReachability>();
  std::shared_ptr<FakeChannel>      channel      = std::make_shared<FakeChannel>();
  std::shared_ptr<CheckLockManager> manager;

  Fixture() {
    auto authorizer = std::make_shared<resync::lock::StaticAuthorizer>(std::vector<resync::lock::Credential>{{"mgr-1", "4321"}});
    manager = std::make_shared<CheckLockManager>(repo, clock, authorizer, reachability, channel);
    channel->manager = manager.get();
    reachability->reachable = {"t1", "t2", "t3"};
  }

  void SeedCheck(const std::string& id) {
    CheckRecord check;
    check.id            = id;
    check.property_id   = "downtown";
    check.business_date = "2026-01-05";
    check.revision      = 3;
    check.updated_at_ms = 1000;
    check.line_items.push_back({.id = "li-burger", .menu_item_id = "burger", .name = "Burger", .quantity = 1, .unit_price_cents = 1200,
                                .updated_at_ms = 1000});

    auto       tx     = repo->Begin();
    const auto stored = repo->UpsertCheck(*tx, check);
    tx->Commit();
    assert(stored);
  }

  CheckRecord Load(const std::string& id) {
    auto tx    = repo->Begin();
    auto check = repo->GetCheck(*tx, id);
    tx->Commit();
    assert(check.has_value());
    return *check;
  }

  AcquireLockResponse Acquire(const std::string& check_id, const std::string& requester, LockType type = LOCK_TYPE_ACTIVE) {
    AcquireLockRequest req;
    req.set_check_id(check_id);
    req.set_requester_id(requester);
    req.set_lock_type(type);
    return manager->Acquire(req);
  }

  OverrideLockResponse Override(const std::string& check_id, const std::string& requester, bool acknowledge_risk,
                                const std::string& pin = "4321") {
    OverrideLockRequest req;
    req.set_check_id(check_id);
    req.set_requester_id(requester);
    req.mutable_credential()->set_employee_id("mgr-1");
    req.mutable_credential()->set_pin(pin);
    req.set_acknowledge_risk(acknowledge_risk);
    return manager->Override(req);
  }

  ResolveConflictResponse Resolve(const std::string& check_id, Resolution resolution, bool acknowledge_risk = false) {
    ResolveConflictRequest req;
    req.set_check_id(check_id);
    req.set_resolution(resolution);
    req.set_acknowledge_risk(acknowledge_risk);
    req.set_resolver_id("mgr-1");
    req.mutable_credential()->set_employee_id("mgr-1");
    req.mutable_credential()->set_pin("4321");
    return manager->ResolveConflict(req);
  }

  LockInfo Status(const std::string& check_id, const std::string& observer) {
    GetLockStatusRequest req;
    req.set_check_id(check_id);
    req.set_observer_id(observer);
    return manager->GetLockStatus(req).lock();
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestConcurrentAcquireGrantsExactlyOne() {
  Fixture                  f;
  std::atomic<int>         granted{0};
  std::atomic<int>         in_use{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      const auto resp = f.Acquire("chk-1", "t" + std::to_string(i));
      if (resp.outcome() == ACQUIRE_OUTCOME_GRANTED) ++granted;
      if (resp.outcome() == ACQUIRE_OUTCOME_IN_USE || resp.outcome() == ACQUIRE_OUTCOME_HOLDER_OFFLINE) ++in_use;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(granted.load() == 1);
  assert(in_use.load() == 7);
}

void TestAcquireOutcomes() {
  Fixture f;

  assert(f.Acquire("chk-1", "t1").outcome() == ACQUIRE_OUTCOME_GRANTED);
  assert(f.Acquire("chk-1", "t1").outcome() == ACQUIRE_OUTCOME_ALREADY_HELD);

  const auto busy = f.Acquire("chk-1", "t2");
  assert(busy.outcome() == ACQUIRE_OUTCOME_IN_USE);
  assert(busy.lock().holder_id() == "t1");

  f.reachability->reachable.erase("t1");
  assert(f.Acquire("chk-1", "t2").outcome() == ACQUIRE_OUTCOME_HOLDER_OFFLINE);

  const auto view = f.Acquire("chk-1", "t3", LOCK_TYPE_VIEW);
  assert(view.outcome() == ACQUIRE_OUTCOME_GRANTED);
  assert(view.lock().holder_id() == "t1");
  assert(view.lock().viewers_size() == 1);

  assert(Throws<resync::util::InvalidArgument>([&] { f.Acquire("", "t1"); }));
}

void TestReleaseOnlyByHolder() {
  Fixture f;
  f.Acquire("chk-1", "t1");

  ReleaseLockRequest req;
  req.set_check_id("chk-1");
  req.set_holder_id("t2");
  assert(!f.manager->Release(req).released());

  req.set_holder_id("t1");
  assert(f.manager->Release(req).released());
  assert(f.Acquire("chk-1", "t2").outcome() == ACQUIRE_OUTCOME_GRANTED);
}

void TestIndicatorColors() {
  Fixture f;
  assert(f.Status("chk-1", "t2").indicator() == LOCK_INDICATOR_GREEN);

  f.Acquire("chk-1", "t1");
  assert(f.Status("chk-1", "t1").indicator() == LOCK_INDICATOR_GREEN);
  assert(f.Status("chk-1", "t2").indicator() == LOCK_INDICATOR_YELLOW);

  f.reachability->reachable.erase("t1");
  assert(f.Status("chk-1", "t2").indicator() == LOCK_INDICATOR_RED);
}

void TestOverrideRequiresManager() {
  Fixture f;
  f.Acquire("chk-1", "t1");
  assert(Throws<resync::util::Unauthorized>([&] { f.Override("chk-1", "t2", false, "0000"); }));
  assert(f.Override("chk-2", "t2", false).outcome() == OVERRIDE_OUTCOME_NOT_LOCKED);
}

void TestOverrideTransfersFromReachableHolder() {
  Fixture f;
  f.SeedCheck("chk-1");
  f.Acquire("chk-1", "t1");

  const auto resp = f.Override("chk-1", "t2", false);
  assert(resp.outcome() == OVERRIDE_OUTCOME_TRANSFERRED);
  assert(resp.locked_check_id() == "chk-1");
  assert(resp.lock().holder_id() == "t2");
  assert(f.channel->requests == 1);

  auto tx    = f.repo->Begin();
  auto audit = f.repo->ListAudit(*tx, "chk-1");
  tx->Commit();
  assert(audit.size() == 1);
  assert(audit[0].action == "lock_override_transfer");
}

void TestOverrideWithoutAcknowledgementKeepsHolder() {
  Fixture f;
  f.Acquire("chk-1", "t1");
  f.channel->acknowledge = false;

  assert(f.Override("chk-1", "t2", false).outcome() == OVERRIDE_OUTCOME_HOLDER_OFFLINE);
  assert(f.Status("chk-1", "t2").holder_id() == "t1");
}

void TestOfflineHolderNeedsRiskAcknowledgement() {
  Fixture f;
  f.SeedCheck("chk-1");
  f.Acquire("chk-1", "t1");
  f.reachability->reachable.erase("t1");

  assert(Throws<resync::util::InvalidState>([&] { f.Override("chk-1", "t2", false); }));
  assert(f.channel->requests == 0);
}

std::string CloneAway(Fixture& f) {
  f.SeedCheck("chk-1");
  f.Acquire("chk-1", "t1");
  f.reachability->reachable.erase("t1");

  const auto resp = f.Override("chk-1", "t2", true);
  assert(resp.outcome() == OVERRIDE_OUTCOME_CLONED);
  assert(resp.locked_check_id() != "chk-1");
  assert(resp.lock().holder_id() == "t2");
  assert(resp.lock().conflict_pending());
  return resp.locked_check_id();
}

void TestOverrideClonesFromOfflineHolder() {
  Fixture    f;
  const auto clone_id = CloneAway(f);

  const auto original = f.Load("chk-1");
  assert(original.conflict_state == CONFLICT_STATE_PENDING);
  assert(original.conflict_peer_id == clone_id);
  assert(original.displaced_holder == "t1");
  assert(original.canonical);
  assert(original.revision == 4);

  const auto clone = f.Load(clone_id);
  assert(clone.conflict_state == CONFLICT_STATE_CLONE);
  assert(clone.conflict_peer_id == "chk-1");
  assert(!clone.canonical);
  assert(clone.line_items.size() == 1);

  // The displaced holder still holds the original.
  assert(f.Status("chk-1", "t2").holder_id() == "t1");
  assert(f.Status("chk-1", "t2").conflict_pending());

  ListConflictsRequest list;
  list.set_terminal_id("t1");
  const auto conflicts = f.manager->ListConflicts(list);
  assert(conflicts.check_ids_size() == 1);
  assert(conflicts.check_ids(0) == "chk-1");
  assert(f.manager->OnTerminalReconnected("t1").size() == 1);

  GetConflictRequest get;
  get.set_check_id(clone_id);
  const auto pair = f.manager->GetConflict(get);
  assert(pair.pending());
  assert(pair.original().id() == "chk-1");
  assert(pair.clone().id() == clone_id);

  // A check already in conflict cannot be cloned again.
  ReleaseLockRequest release;
  release.set_check_id("chk-1");
  release.set_holder_id("t1");
  f.manager->Release(release);
  f.Acquire("chk-1", "t1");
  assert(Throws<resync::util::InvalidState>([&] { f.Override("chk-1", "t3", true); }));
}

void TestMergeResolution() {
  Fixture    f;
  const auto clone_id = CloneAway(f);

  // Clone edits: later quantity change plus a new item.
  auto clone                     = f.Load(clone_id);
  clone.line_items[0].quantity     = 2;
  clone.line_items[0].updated_at_ms = 2000;
  clone.line_items.push_back({.id = "li-fries", .menu_item_id = "fries", .name = "Fries", .quantity = 1, .unit_price_cents = 400,
                              .updated_at_ms = 2000});
  clone.updated_at_ms = 2000;
  clone.revision++;
  {
    auto       tx     = f.repo->Begin();
    const auto stored = f.repo->UpsertCheck(*tx, clone);
    tx->Commit();
    assert(stored);
  }

  f.reachability->reachable.insert("t1");
  const auto resp = f.Resolve(clone_id, RESOLUTION_MERGE);
  assert(resp.canonical().id() == "chk-1");
  assert(resp.canonical().line_items_size() == 2);
  assert(resp.canonical().line_items(0).quantity() == 2);
  assert(resp.diverged_line_items_size() == 1);
  assert(resp.diverged_line_items(0) == "li-burger");

  const auto canonical = f.Load("chk-1");
  assert(canonical.conflict_state == CONFLICT_STATE_NONE);
  assert(canonical.canonical);
  assert(canonical.conflict_peer_id.empty());
  assert(canonical.displaced_holder.empty());
  assert(canonical.revision == 5);

  const auto retired = f.Load(clone_id);
  assert(retired.conflict_state == CONFLICT_STATE_RESOLVED);
  assert(!retired.canonical);

  // Locks on both checks are dropped and the retired clone is closed for edits.
  assert(!f.Status("chk-1", "t3").locked());
  assert(!f.Status(clone_id, "t3").locked());
  assert(Throws<resync::util::InvalidState>([&] { f.Acquire(clone_id, "t3"); }));

  auto tx    = f.repo->Begin();
  auto audit = f.repo->ListAudit(*tx, "chk-1");
  tx->Commit();
  assert(audit.back().action == "conflict_resolved");
  assert(audit.back().actor_id == "mgr-1");
}

void TestKeepCloneResolution() {
  Fixture    f;
  const auto clone_id = CloneAway(f);

  auto clone                 = f.Load(clone_id);
  clone.line_items[0].quantity = 5;
  {
    auto       tx     = f.repo->Begin();
    const auto stored = f.repo->UpsertCheck(*tx, clone);
    tx->Commit();
    assert(stored);
  }

  f.reachability->reachable.insert("t1");
  const auto resp = f.Resolve("chk-1", RESOLUTION_KEEP_B);
  assert(resp.canonical().id() == "chk-1");
  assert(resp.canonical().line_items(0).quantity() == 5);
  assert(resp.diverged_line_items_size() == 0);
}

void TestMergeKeepsNewerLineItemWhole() {
  using resync::db::model::LineItemRecord;

  // original repriced the burger later; clone changed its quantity earlier
  const std::vector<LineItemRecord> original{
      {.id = "li-burger", .menu_item_id = "burger", .name = "Burger", .quantity = 1, .unit_price_cents = 1500, .updated_at_ms = 3000},
      {.id = "li-soda", .menu_item_id = "soda", .name = "Soda", .quantity = 1, .unit_price_cents = 300, .updated_at_ms = 1000},
  };
  const std::vector<LineItemRecord> clone{
      {.id = "li-burger", .menu_item_id = "burger", .name = "Burger", .quantity = 3, .unit_price_cents = 1200, .updated_at_ms = 2000},
      {.id = "li-soda", .menu_item_id = "soda", .name = "Soda", .quantity = 1, .unit_price_cents = 350, .updated_at_ms = 1000},
  };

  const auto merged = resync::lock::MergeLineItems(original, clone);
  assert(merged.line_items.size() == 2);
  assert(merged.line_items[0].quantity == 1);
  assert(merged.line_items[0].unit_price_cents == 1500);
  assert(merged.line_items[1].unit_price_cents == 300);
  assert((merged.diverged == std::vector<std::string>{"li-burger"}));
}

void TestResolveWaitsForDisplacedTerminal() {
  Fixture    f;
  const auto clone_id = CloneAway(f);

  // t1 may still be holding edits of the original.
  assert(Throws<resync::util::InvalidState>([&] { f.Resolve("chk-1", RESOLUTION_KEEP_A); }));
  assert(f.Load("chk-1").conflict_state == CONFLICT_STATE_PENDING);
  assert(f.Load(clone_id).conflict_state == CONFLICT_STATE_CLONE);

  const auto resp = f.Resolve("chk-1", RESOLUTION_KEEP_A, true);
  assert(resp.canonical().conflict_state() == CONFLICT_STATE_NONE);
}

void TestResolveRejectsBadRequests() {
  Fixture f;
  f.SeedCheck("chk-1");

  assert(Throws<resync::util::InvalidState>([&] { f.Resolve("chk-1", RESOLUTION_KEEP_A); }));
  assert(Throws<resync::util::InvalidArgument>([&] { f.Resolve("chk-1", RESOLUTION_UNSPECIFIED); }));
  assert(Throws<resync::util::NotFound>([&] { f.Resolve("missing", RESOLUTION_KEEP_A); }));
}

void TestReleaseAllDropsTerminalLocks() {
  Fixture f;
  f.Acquire("chk-1", "t1");
  f.Acquire("chk-2", "t1");
  f.Acquire("chk-3", "t2");

  const auto released = f.manager->ReleaseAll("t1");
  assert(released.size() == 2);
  assert(f.manager->ListLocks().size() == 1);
}

} // namespace

int main() {
  TestConcurrentAcquireGrantsExactlyOne();
  TestAcquireOutcomes();
  TestReleaseOnlyByHolder();
  TestIndicatorColors();
  TestOverrideRequiresManager();
  TestOverrideTransfersFromReachableHolder();
  TestOverrideWithoutAcknowledgementKeepsHolder();
  TestOfflineHolderNeedsRiskAcknowledgement();
  TestOverrideClonesFromOfflineHolder();
  TestMergeResolution();
  TestKeepCloneResolution();
  TestMergeKeepsNewerLineItemWhole();
  TestResolveWaitsForDisplacedTerminal();
  TestResolveRejectsBadRequests();
  TestReleaseAllDropsTerminalLocks();

  std::cout << "resync_unit_check_lock_manager: pass\n";
  return 0;
}
