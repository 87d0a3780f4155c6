#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace resync::db::sqlite {

// BEGIN IMMEDIATE on the shared connection. The writer lock is taken up
// front so a replay enqueue never fails halfway through a check save, and
// the connection's transaction mutex is held until the transaction ends.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
};

} // namespace resync::db::sqlite
