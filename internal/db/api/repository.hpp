#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/check_record.hpp"
#include "internal/db/model/fiscal_period_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/property_record.hpp"
#include "internal/db/model/replay_item_record.hpp"
#include "internal/db/model/time_entry_record.hpp"

namespace resync::db {

struct ReplayCounts {
  uint64_t backlog = 0;
  uint64_t failed  = 0;
  // created_at_ms of the oldest item awaiting sync, 0 when empty
  uint64_t oldest_created_ms = 0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Replay enqueue + entity write in one transaction are atomic
    (write-ahead guarantee for local mutations)

  On a terminal the repository is the local store backing the replay
  queue; on the relay host and cloud it is the authoritative store.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Properties
  // ---------------------------------------------------------------------

  virtual Result UpsertProperty(Transaction&, const model::PropertyRecord&) = 0;

  virtual std::optional<model::PropertyRecord> GetProperty(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PropertyRecord> ListProperties(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Fiscal periods
  // ---------------------------------------------------------------------

  // AlreadyExists if the property already has a period for that date.
  virtual Result InsertFiscalPeriod(Transaction&, const model::FiscalPeriodRecord&) = 0;

  virtual Result UpdateFiscalPeriod(Transaction&, const model::FiscalPeriodRecord&) = 0;

  virtual std::optional<model::FiscalPeriodRecord> GetFiscalPeriod(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::FiscalPeriodRecord> GetFiscalPeriodByDate(Transaction&, const std::string& property_id,
                                                                         const std::string& business_date) = 0;

  // Ascending by business_date.
  virtual std::vector<model::FiscalPeriodRecord> ListFiscalPeriods(Transaction&, const std::string& property_id) = 0;

  // ---------------------------------------------------------------------
  // Checks
  // ---------------------------------------------------------------------

  // Replaces the check and its line items.
  virtual Result UpsertCheck(Transaction&, const model::CheckRecord&) = 0;

  virtual std::optional<model::CheckRecord> GetCheck(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::CheckRecord> ListChecks(Transaction&, const std::string& property_id, const std::string& business_date) = 0;

  // Checks flagged conflict-pending that were cloned away from holder_id.
  virtual std::vector<model::CheckRecord> ListConflictedChecks(Transaction&, const std::string& holder_id) = 0;

  virtual Result DeleteCheck(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Payments
  // ---------------------------------------------------------------------

  virtual Result UpsertPayment(Transaction&, const model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&, const std::string& property_id, const std::string& business_date) = 0;

  virtual Result DeletePayment(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Time entries
  // ---------------------------------------------------------------------

  virtual Result UpsertTimeEntry(Transaction&, const model::TimeEntryRecord&) = 0;

  virtual std::optional<model::TimeEntryRecord> GetTimeEntry(Transaction&, const std::string& id) = 0;

  // Entries with clock_out_at_ms == 0, oldest clock-in first.
  virtual std::vector<model::TimeEntryRecord> ListOpenTimeEntries(Transaction&, const std::string& property_id) = 0;

  virtual Result DeleteTimeEntry(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Replay queue
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result EnqueueReplay(Transaction&, model::ReplayItemRecord& record) = 0;

  // Pending and failed items ordered by (created_at_ms, seq).
  virtual std::vector<model::ReplayItemRecord> ListReplayBatch(Transaction&, uint32_t limit) = 0;

  // The oldest awaiting item of each entity. Never-failed heads come first,
  // then failed heads least recently attempted, each group by
  // (created_at_ms, seq). An entity whose oldest item is syncing has no head.
  virtual std::vector<model::ReplayItemRecord> ListReplayHeads(Transaction&, uint32_t limit) = 0;

  virtual std::vector<model::ReplayItemRecord> ListReplayForEntity(Transaction&, const std::string& entity_id) = 0;

  virtual Result UpdateReplay(Transaction&, const model::ReplayItemRecord&) = 0;

  virtual Result DeleteReplay(Transaction&, const std::string& id) = 0;

  // syncing -> pending; returns the number of rows touched.
  virtual uint64_t ResetSyncingReplay(Transaction&) = 0;

  virtual ReplayCounts CountReplay(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  virtual Result InsertAudit(Transaction&, const model::AuditRecord&) = 0;

  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& target_id) = 0;
};

} // namespace resync::db
