#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace resync::db {

/*
  One unit of work against a Repository.

  Every backend gives the same guarantees, which the replay queue relies
  on to keep enqueue and local write atomic:

    - writes are invisible to other transactions until Commit()
    - Rollback() or destruction without Commit() discards them
    - Commit()/Rollback() on a finished transaction is an InvalidState

  Backends implement DoCommit/DoRollback and call RollbackIfOpen() from
  their destructor.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit() {
    RequireOpen("commit");
    // A failed commit leaves the transaction open; the destructor rolls back.
    DoCommit();
    state_ = State::kCommitted;
  }

  void Rollback() {
    RequireOpen("rollback");
    state_ = State::kRolledBack;
    DoRollback();
  }

  bool IsOpen() const {
    return state_ == State::kOpen;
  }

 protected:
  Transaction() = default;

  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

  // Destructor helper; a backend cannot report errors from there.
  template <typename OnError>
  void RollbackIfOpen(OnError&& on_error) noexcept {
    if (!IsOpen()) {
      return;
    }
    state_ = State::kRolledBack;
    try {
      DoRollback();
    } catch (const std::exception& e) {
      on_error(e);
    }
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* action) const {
    if (state_ != State::kOpen) {
      throw util::InvalidState(std::string("cannot ") + action + " a finished transaction");
    }
  }

  State state_ = State::kOpen;
};

} // namespace resync::db
