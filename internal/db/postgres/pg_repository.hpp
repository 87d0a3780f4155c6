#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace resync::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertProperty(Transaction&, const model::PropertyRecord&) override;
  std::optional<model::PropertyRecord> GetProperty(Transaction&, const std::string&) override;
  std::vector<model::PropertyRecord> ListProperties(Transaction&) override;

  Result InsertFiscalPeriod(Transaction&, const model::FiscalPeriodRecord&) override;
  Result UpdateFiscalPeriod(Transaction&, const model::FiscalPeriodRecord&) override;
  std::optional<model::FiscalPeriodRecord> GetFiscalPeriod(Transaction&, const std::string&) override;
  std::optional<model::FiscalPeriodRecord> GetFiscalPeriodByDate(
      Transaction&, const std::string& property_id, const std::string& business_date) override;
  std::vector<model::FiscalPeriodRecord> ListFiscalPeriods(Transaction&, const std::string& property_id) override;

  Result UpsertCheck(Transaction&, const model::CheckRecord&) override;
  std::optional<model::CheckRecord> GetCheck(Transaction&, const std::string&) override;
  std::vector<model::CheckRecord> ListChecks(
      Transaction&, const std::string& property_id, const std::string& business_date) override;
  std::vector<model::CheckRecord> ListConflictedChecks(Transaction&, const std::string& holder_id) override;
  Result DeleteCheck(Transaction&, const std::string&) override;

  Result UpsertPayment(Transaction&, const model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, const std::string&) override;
  std::vector<model::PaymentRecord> ListPayments(
      Transaction&, const std::string& property_id, const std::string& business_date) override;
  Result DeletePayment(Transaction&, const std::string&) override;

  Result UpsertTimeEntry(Transaction&, const model::TimeEntryRecord&) override;
  std::optional<model::TimeEntryRecord> GetTimeEntry(Transaction&, const std::string&) override;
  std::vector<model::TimeEntryRecord> ListOpenTimeEntries(Transaction&, const std::string& property_id) override;
  Result DeleteTimeEntry(Transaction&, const std::string&) override;

  Result EnqueueReplay(Transaction&, model::ReplayItemRecord&) override;
  std::vector<model::ReplayItemRecord> ListReplayBatch(Transaction&, uint32_t limit) override;
  std::vector<model::ReplayItemRecord> ListReplayHeads(Transaction&, uint32_t limit) override;
  std::vector<model::ReplayItemRecord> ListReplayForEntity(Transaction&, const std::string& entity_id) override;
  Result UpdateReplay(Transaction&, const model::ReplayItemRecord&) override;
  Result DeleteReplay(Transaction&, const std::string&) override;
  uint64_t ResetSyncingReplay(Transaction&) override;
  ReplayCounts CountReplay(Transaction&) override;

  Result InsertAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& target_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);

  static std::vector<model::CheckRecord> ReadChecks(pqxx::work& w, const pqxx::result& res);
};

}
