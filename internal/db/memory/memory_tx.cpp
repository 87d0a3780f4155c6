#include "memory_tx.hpp"

namespace resync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  RollbackIfOpen([](const std::exception&) {});
}

void MemoryTransaction::DoCommit() {
  if (!wrote_) {
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    // Nothing was published; the caller retries from a fresh snapshot.
    wrote_ = false;
    throw util::LockConflict("memory transaction lost a race with version " + std::to_string(repo_.committed_version_));
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

void MemoryTransaction::DoRollback() {
  working_ = {};
}

} // namespace resync::db::memory
