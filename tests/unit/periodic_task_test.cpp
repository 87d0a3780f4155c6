#include "internal/util/periodic_task.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using resync::util::PeriodicTask;

void WaitFor(const std::atomic<int>& counter, int target) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (counter.load() < target && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void TestRunsImmediatelyAndRepeats() {
  std::atomic<int> runs{0};
  PeriodicTask     task("counter", std::chrono::milliseconds(5), [&] { ++runs; });

  task.Start();
  assert(task.IsRunning());
  WaitFor(runs, 3);
  task.Stop();

  assert(runs.load() >= 3);
  assert(!task.IsRunning());
}

void TestStopDoesNotWaitForInterval() {
  std::atomic<int> runs{0};
  PeriodicTask     task("slow", std::chrono::hours(1), [&] { ++runs; });

  task.Start();
  WaitFor(runs, 1);

  const auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
  assert(runs.load() == 1);
}

void TestThrowingBodyKeepsLooping() {
  std::atomic<int> runs{0};
  PeriodicTask     task("flaky", std::chrono::milliseconds(1), [&] {
    ++runs;
    throw std::runtime_error("boom");
  });

  task.Start();
  WaitFor(runs, 3);
  task.Stop();
  assert(runs.load() >= 3);
}

void TestRestartAfterStop() {
  std::atomic<int> runs{0};
  PeriodicTask     task("restart", std::chrono::hours(1), [&] { ++runs; });

  task.Start();
  WaitFor(runs, 1);
  task.Stop();

  task.Start();
  WaitFor(runs, 2);
  task.Stop();
  assert(runs.load() == 2);
}

} // namespace

int main() {
  TestRunsImmediatelyAndRepeats();
  TestStopDoesNotWaitForInterval();
  TestThrowingBodyKeepsLooping();
  TestRestartAfterStop();

  std::cout << "resync_unit_periodic_task: pass\n";
  return 0;
}
