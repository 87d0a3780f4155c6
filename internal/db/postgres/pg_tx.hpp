#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace resync::db::postgres {

// SERIALIZABLE so two relay-side applies of the same check cannot
// interleave. The pooled connection goes back to the pool on destruction.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  PgPool::Lease               conn_;
  std::unique_ptr<pqxx::work> work_;
};

} // namespace resync::db::postgres
