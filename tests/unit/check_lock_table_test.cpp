#include "internal/lock/check_lock_table.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using resync::lock::CheckLockTable;

const resync::util::TimePoint kNow = resync::util::TimePoint{} + std::chrono::hours(1);

void TestCompareAndSwapTransitions() {
  CheckLockTable table;

  assert(table.CompareAndSwap("chk-1", "", "t1", kNow));
  assert(!table.CompareAndSwap("chk-1", "", "t2", kNow));
  assert(table.Get("chk-1")->holder_id == "t1");
  assert(table.Get("chk-1")->acquired_at == kNow);

  const auto revision = table.Get("chk-1")->revision;
  assert(!table.CompareAndSwap("chk-1", "t1", "t2", kNow, revision + 1));
  assert(table.CompareAndSwap("chk-1", "t1", "t2", kNow, revision));
  assert(table.Get("chk-1")->revision == revision + 1);

  assert(!table.CompareAndSwap("chk-1", "t1", "", kNow));
  assert(table.CompareAndSwap("chk-1", "t2", "", kNow));
  assert(!table.Get("chk-1").has_value());
}

void TestFailedSwapLeavesNoEntry() {
  CheckLockTable table;
  assert(!table.CompareAndSwap("chk-1", "t1", "", kNow));
  assert(!table.Get("chk-1").has_value());
  assert(table.List().empty());
}

void TestViewersCoexistWithHolder() {
  CheckLockTable table;
  table.AddViewer("chk-1", "t2");
  table.AddViewer("chk-1", "t3");
  assert(table.CompareAndSwap("chk-1", "", "t1", kNow));

  auto lock = table.Get("chk-1");
  assert(lock->holder_id == "t1");
  assert(lock->viewers.size() == 2);

  assert(table.RemoveViewer("chk-1", "t2"));
  assert(!table.RemoveViewer("chk-1", "t2"));

  table.Clear("chk-1");
  lock = table.Get("chk-1");
  assert(lock->holder_id.empty());
  assert(lock->viewers.size() == 1);
}

void TestReleaseAllCoversLocksAndViews() {
  CheckLockTable table;
  assert(table.CompareAndSwap("chk-b", "", "t1", kNow));
  assert(table.CompareAndSwap("chk-a", "", "t1", kNow));
  assert(table.CompareAndSwap("chk-c", "", "t2", kNow));
  table.AddViewer("chk-c", "t1");
  table.AddViewer("chk-d", "t1");

  const auto released = table.ReleaseAll("t1");
  assert((released == std::vector<std::string>{"chk-a", "chk-b", "chk-c", "chk-d"}));

  const auto remaining = table.List();
  assert(remaining.size() == 1);
  assert(remaining[0].check_id == "chk-c");
  assert(remaining[0].holder_id == "t2");
  assert(remaining[0].viewers.empty());
}

void TestConcurrentAcquireHasOneWinner() {
  for (int round = 0; round < 20; ++round) {
    CheckLockTable           table;
    std::atomic<int>         winners{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&, i] {
        if (table.CompareAndSwap("chk-hot", "", "t" + std::to_string(i), kNow)) ++winners;
      });
    }
    for (auto& thread : threads) thread.join();

    assert(winners.load() == 1);
    assert(!table.Get("chk-hot")->holder_id.empty());
  }
}

} // namespace

int main() {
  TestCompareAndSwapTransitions();
  TestFailedSwapLeavesNoEntry();
  TestViewersCoexistWithHolder();
  TestReleaseAllCoversLocksAndViews();
  TestConcurrentAcquireHasOneWinner();

  std::cout << "resync_unit_check_lock_table: pass\n";
  return 0;
}
