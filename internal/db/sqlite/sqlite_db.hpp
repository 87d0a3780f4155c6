#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace resync::db::sqlite {

/*
  The terminal's local store: one sqlite3 connection owned for the life of
  the process. Every SqliteTransaction serializes on TxMutex() so BEGIN
  never nests on the shared handle.

  Opening runs a quick integrity check; a file damaged by a power cut is
  reported as util::Unavailable rather than being written to.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements that return no rows.
  void Exec(const std::string& sql);

  // Caller finalizes the returned statement.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(bool wal_mode);
  void VerifyIntegrity();
  void Close() noexcept;

  [[noreturn]] void Fail(int rc, const std::string& what) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace resync::db::sqlite
