#include "internal/replay/replay_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace resync::v1;
using resync::replay::ReplayQueue;
using resync::util::ManualClock;

struct Fixture {
  std::shared_ptr<resync::db::memory::MemoryRepository> repo  = std::make_shared<resync::db::memory::MemoryRepository>();
  std::shared_ptr<ManualClock>                          clock = std::make_shared<ManualClock>(resync::util::FromUnixMillis(1'000'000));
  ReplayQueue                                           queue{repo, clock};
};

void TestBatchIsFifo() {
  Fixture f;
  const auto a = f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-1", REPLAY_OPERATION_UPDATE, "{}");
  // Same millisecond: seq breaks the tie.
  const auto b = f.queue.Enqueue(ENTITY_TYPE_PAYMENT, "pay-1", REPLAY_OPERATION_UPDATE, "{}");
  f.clock->Advance(5ms);
  const auto c = f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-1", REPLAY_OPERATION_UPDATE, "{}");

  auto batch = f.queue.NextBatch(10);
  assert(batch.size() == 3);
  assert(batch[0].id == a);
  assert(batch[1].id == b);
  assert(batch[2].id == c);

  batch = f.queue.NextBatch(2);
  assert(batch.size() == 2);
  assert(batch[1].id == b);
}

void TestRejectsIncompleteItems() {
  Fixture f;
  bool    threw = false;
  try {
    f.queue.Enqueue(ENTITY_TYPE_CHECK, "", REPLAY_OPERATION_UPDATE, "{}");
  } catch (const resync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.queue.Enqueue(ENTITY_TYPE_UNSPECIFIED, "chk-1", REPLAY_OPERATION_UPDATE, "{}");
  } catch (const resync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedItemsStayQueued() {
  Fixture f;
  f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-1", REPLAY_OPERATION_UPDATE, "{}");

  auto item = f.queue.NextBatch(1).front();
  f.queue.MarkSyncing(item);
  assert(f.queue.NextBatch(10).empty());

  f.queue.MarkFailed(item, "relay timeout");
  f.queue.MarkSyncing(item);
  f.queue.MarkFailed(item, "relay timeout");

  const auto retry = f.queue.NextBatch(10);
  assert(retry.size() == 1);
  assert(retry[0].status == REPLAY_STATUS_FAILED);
  assert(retry[0].attempts == 2);
  assert(retry[0].error_message == "relay timeout");

  f.queue.Complete(item.id);
  assert(f.queue.NextBatch(10).empty());
  assert(f.queue.PendingForEntity("chk-1").empty());
}

void TestResetInFlightAfterCrash() {
  Fixture f;
  f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-1", REPLAY_OPERATION_UPDATE, "{}");
  f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-2", REPLAY_OPERATION_UPDATE, "{}");

  for (auto& item : f.queue.NextBatch(10)) f.queue.MarkSyncing(item);
  assert(f.queue.NextBatch(10).empty());

  // A fresh queue over the same store plays the restarted process.
  ReplayQueue restarted(f.repo, f.clock);
  assert(restarted.ResetInFlight() == 2);
  assert(restarted.NextBatch(10).size() == 2);
  assert(restarted.ResetInFlight() == 0);
}

void TestStats() {
  Fixture f;
  assert(f.queue.Stats().backlog == 0);
  assert(f.queue.Stats().oldest_pending_age == 0ms);

  f.queue.Enqueue(ENTITY_TYPE_CHECK, "chk-1", REPLAY_OPERATION_UPDATE, "{}");
  f.clock->Advance(1s);
  f.queue.Enqueue(ENTITY_TYPE_TIME_ENTRY, "te-1", REPLAY_OPERATION_DELETE, "{}");

  auto item = f.queue.PendingForEntity("te-1").front();
  f.queue.MarkFailed(item, "boom");
  f.clock->Advance(2s);

  const auto stats = f.queue.Stats();
  assert(stats.backlog == 2);
  assert(stats.failed == 1);
  assert(stats.oldest_pending_age == 3s);
}

} // namespace

int main() {
  TestBatchIsFifo();
  TestRejectsIncompleteItems();
  TestFailedItemsStayQueued();
  TestResetInFlightAfterCrash();
  TestStats();

  std::cout << "resync_unit_replay_queue: pass\n";
  return 0;
}
