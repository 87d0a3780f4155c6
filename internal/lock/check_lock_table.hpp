#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lock.hpp"

namespace resync::lock {

/*
  Check lock table.

  Every holder transition is a compare-and-swap on
  (check_id, expected_holder[, expected_revision]) under one mutex, so two
  concurrent acquires of an unlocked check produce exactly one holder.
*/
class CheckLockTable {
 public:
  std::optional<CheckLock> Get(const std::string& check_id) const;

  // Empty expected_holder means "currently unlocked"; empty new_holder
  // releases. Returns false without change when the expectation fails.
  bool CompareAndSwap(const std::string& check_id, const std::string& expected_holder, const std::string& new_holder,
                      util::TimePoint now, std::optional<uint64_t> expected_revision = std::nullopt);

  void AddViewer(const std::string& check_id, const std::string& viewer_id);
  bool RemoveViewer(const std::string& check_id, const std::string& viewer_id);

  // Drops the active lock whoever holds it (conflict resolution).
  void Clear(const std::string& check_id);

  // Releases every active lock and view of the holder; returns the check ids.
  std::vector<std::string> ReleaseAll(const std::string& holder_id);

  std::vector<CheckLock> List() const;

 private:
  void EraseIfIdleLocked(const std::string& check_id);

  mutable std::mutex mutex_;

  std::unordered_map<std::string, CheckLock> locks_;
};

} // namespace resync::lock
