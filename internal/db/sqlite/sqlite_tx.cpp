#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace resync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  RollbackIfOpen([this](const std::exception& e) {
    RESYNC_LOG_WARN("Abandoned sqlite transaction did not roll back",
                    {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  });
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
  guard_.unlock();
}

void SqliteTransaction::DoRollback() {
  // Release the mutex even if ROLLBACK fails; sqlite ends the transaction on error.
  struct Unlock {
    std::unique_lock<std::mutex>& guard;
    ~Unlock() {
      if (guard.owns_lock()) guard.unlock();
    }
  } unlock{guard_};
  db_->Exec("ROLLBACK;");
}

} // namespace resync::db::sqlite
