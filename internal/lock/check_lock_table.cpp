#include "check_lock_table.hpp"

#include <algorithm>

namespace resync::lock {

void CheckLockTable::EraseIfIdleLocked(const std::string& check_id) {
  auto it = locks_.find(check_id);
  if (it != locks_.end() && it->second.holder_id.empty() && it->second.viewers.empty()) {
    locks_.erase(it);
  }
}

std::optional<CheckLock> CheckLockTable::Get(const std::string& check_id) const {
  std::lock_guard lock(mutex_);

  auto it = locks_.find(check_id);
  if (it == locks_.end()) return std::nullopt;
  return it->second;
}

bool CheckLockTable::CompareAndSwap(const std::string& check_id, const std::string& expected_holder, const std::string& new_holder,
                                    util::TimePoint now, std::optional<uint64_t> expected_revision) {
  std::lock_guard lock(mutex_);

  auto&       entry   = locks_[check_id];
  const bool  created = entry.check_id.empty();
  entry.check_id      = check_id;

  if (entry.holder_id != expected_holder || (expected_revision && entry.revision != *expected_revision)) {
    if (created) locks_.erase(check_id);
    return false;
  }

  entry.holder_id   = new_holder;
  entry.acquired_at = new_holder.empty() ? util::TimePoint{} : now;
  entry.revision++;

  if (new_holder.empty()) EraseIfIdleLocked(check_id);
  return true;
}

void CheckLockTable::AddViewer(const std::string& check_id, const std::string& viewer_id) {
  std::lock_guard lock(mutex_);

  auto& entry    = locks_[check_id];
  entry.check_id = check_id;
  entry.viewers.insert(viewer_id);
}

bool CheckLockTable::RemoveViewer(const std::string& check_id, const std::string& viewer_id) {
  std::lock_guard lock(mutex_);

  auto it = locks_.find(check_id);
  if (it == locks_.end()) return false;

  const bool removed = it->second.viewers.erase(viewer_id) > 0;
  EraseIfIdleLocked(check_id);
  return removed;
}

void CheckLockTable::Clear(const std::string& check_id) {
  std::lock_guard lock(mutex_);

  auto it = locks_.find(check_id);
  if (it == locks_.end()) return;

  it->second.holder_id.clear();
  it->second.acquired_at = util::TimePoint{};
  it->second.revision++;
  EraseIfIdleLocked(check_id);
}

std::vector<std::string> CheckLockTable::ReleaseAll(const std::string& holder_id) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> released;
  for (auto it = locks_.begin(); it != locks_.end();) {
    auto& entry   = it->second;
    bool  touched = entry.viewers.erase(holder_id) > 0;
    if (entry.holder_id == holder_id) {
      entry.holder_id.clear();
      entry.acquired_at = util::TimePoint{};
      entry.revision++;
      touched = true;
    }
    if (touched) released.push_back(entry.check_id);

    if (entry.holder_id.empty() && entry.viewers.empty()) {
      it = locks_.erase(it);
      continue;
    }
    ++it;
  }

  std::sort(released.begin(), released.end());
  return released;
}

std::vector<CheckLock> CheckLockTable::List() const {
  std::lock_guard lock(mutex_);

  std::vector<CheckLock> out;
  out.reserve(locks_.size());
  for (const auto& [_, entry] : locks_) out.push_back(entry);
  std::sort(out.begin(), out.end(), [](const CheckLock& a, const CheckLock& b) { return a.check_id < b.check_id; });
  return out;
}

} // namespace resync::lock
