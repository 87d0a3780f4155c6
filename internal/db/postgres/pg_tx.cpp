#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace resync::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(conn_.Prepared());
  work_->exec("SET TRANSACTION ISOLATION LEVEL SERIALIZABLE");
}

PgTransaction::~PgTransaction() {
  RollbackIfOpen([](const std::exception& e) {
    RESYNC_LOG_WARN("Abandoned postgres transaction did not abort", {observability::StringField("error", e.what())});
  });
  // The work must end before its connection returns to the pool.
  work_.reset();
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace resync::db::postgres
