#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace resync::db::memory {

// Optimistic: works on a private copy of the committed state and publishes
// it only if nobody else committed since the copy was taken. Transactions
// that never asked for Mutable() skip the check.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return working_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    wrote_        = false;
};

} // namespace resync::db::memory
