#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resync::db::sqlite {

namespace {

// Writers wait this long for the file lock before giving up.
constexpr int kBusyTimeoutMs = 5000;

bool IsTransient(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return true;
    default:
      return false;
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (const int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
    const std::string reason = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    Close();
    throw util::Unavailable("cannot open local store " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode);
    VerifyIntegrity();
  } catch (...) {
    Close();
    throw;
  }
  RESYNC_LOG_DEBUG("Local store opened", {observability::StringField("path", path_), observability::BoolField("wal", wal_mode)});
}

SqliteDB::~SqliteDB() {
  Close();
}

void SqliteDB::Close() noexcept {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SqliteDB::Fail(int rc, const std::string& what) const {
  const auto message = what + " on " + path_ + ": " + sqlite3_errmsg(db_);
  if (IsTransient(rc)) {
    throw util::Unavailable(message);
  }
  throw std::runtime_error(message);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string detail = err != nullptr ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  if (IsTransient(rc)) {
    throw util::Unavailable("sqlite exec on " + path_ + ": " + detail);
  }
  throw std::runtime_error("sqlite exec on " + path_ + ": " + detail);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr); rc != SQLITE_OK) {
    Fail(rc, "sqlite prepare");
  }
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  if (const int rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs); rc != SQLITE_OK) {
    Fail(rc, "sqlite busy_timeout");
  }

  // WAL lets status reads proceed while a check save holds the writer lock.
  Exec(wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  // A sale acknowledged to the server has to survive a power cut.
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::VerifyIntegrity() {
  sqlite3_stmt* stmt = Prepare("PRAGMA quick_check;");
  std::string   verdict;
  const int     rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt, 0);
    verdict          = text != nullptr ? reinterpret_cast<const char*>(text) : "";
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    Fail(rc, "sqlite quick_check");
  }
  if (rc == SQLITE_ROW && verdict != "ok") {
    RESYNC_LOG_ERROR("Local store failed integrity check",
                     {observability::StringField("path", path_), observability::StringField("verdict", verdict)});
    throw util::Unavailable("local store " + path_ + " is corrupt: " + verdict);
  }
}

} // namespace resync::db::sqlite
