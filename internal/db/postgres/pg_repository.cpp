#include "pg_repository.hpp"

namespace resync::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

namespace {

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::PropertyRecord ReadProperty(const pqxx::row& row) {
  model::PropertyRecord r;
  r.id                    = Text(row[0]);
  r.name                  = Text(row[1]);
  r.timezone              = Text(row[2]);
  r.rollover_time         = Text(row[3]);
  r.rollover_mode         = static_cast<resync::v1::RolloverMode>(row[4].as<int>());
  r.current_business_date = Text(row[5]);
  r.allow_pm_rollover     = row[6].as<bool>();
  r.auto_clock_out        = row[7].as<bool>();
  return r;
}

model::FiscalPeriodRecord ReadFiscalPeriod(const pqxx::row& row) {
  model::FiscalPeriodRecord r;
  r.id                     = Text(row[0]);
  r.property_id            = Text(row[1]);
  r.business_date          = Text(row[2]);
  r.status                 = static_cast<resync::v1::FiscalPeriodStatus>(row[3].as<int>());
  r.totals.gross_sales     = row[4].as<int64_t>();
  r.totals.net_sales       = row[5].as<int64_t>();
  r.totals.tax_collected   = row[6].as<int64_t>();
  r.totals.discounts_total = row[7].as<int64_t>();
  r.totals.tips_total      = row[8].as<int64_t>();
  r.totals.payment_total   = row[9].as<int64_t>();
  r.totals.check_count     = row[10].as<int64_t>();
  r.totals.guest_count     = row[11].as<int64_t>();
  r.opened_at_ms           = static_cast<uint64_t>(row[12].as<int64_t>());
  r.closed_at_ms           = static_cast<uint64_t>(row[13].as<int64_t>());
  r.notes                  = Text(row[14]);
  return r;
}

model::PaymentRecord ReadPayment(const pqxx::row& row) {
  model::PaymentRecord r;
  r.id            = Text(row[0]);
  r.check_id      = Text(row[1]);
  r.property_id   = Text(row[2]);
  r.business_date = Text(row[3]);
  r.tender_type   = Text(row[4]);
  r.amount_cents  = row[5].as<int64_t>();
  r.tip_cents     = row[6].as<int64_t>();
  r.created_at_ms = static_cast<uint64_t>(row[7].as<int64_t>());
  return r;
}

model::TimeEntryRecord ReadTimeEntry(const pqxx::row& row) {
  model::TimeEntryRecord r;
  r.id              = Text(row[0]);
  r.property_id     = Text(row[1]);
  r.employee_id     = Text(row[2]);
  r.business_date   = Text(row[3]);
  r.clock_in_at_ms  = static_cast<uint64_t>(row[4].as<int64_t>());
  r.clock_out_at_ms = static_cast<uint64_t>(row[5].as<int64_t>());
  r.source          = Text(row[6]);
  return r;
}

model::ReplayItemRecord ReadReplay(const pqxx::row& row) {
  model::ReplayItemRecord r;
  r.id              = Text(row[0]);
  r.seq             = static_cast<uint64_t>(row[1].as<int64_t>());
  r.entity_type     = static_cast<resync::v1::EntityType>(row[2].as<int>());
  r.entity_id       = Text(row[3]);
  r.operation       = static_cast<resync::v1::ReplayOperation>(row[4].as<int>());
  r.payload         = Text(row[5]);
  r.created_at_ms   = static_cast<uint64_t>(row[6].as<int64_t>());
  r.attempts        = static_cast<uint32_t>(row[7].as<int64_t>());
  r.last_attempt_ms = static_cast<uint64_t>(row[8].as<int64_t>());
  r.status          = static_cast<resync::v1::ReplayStatus>(row[9].as<int>());
  r.error_message   = Text(row[10]);
  return r;
}

constexpr const char* kPropertyColumns =
    "id,name,timezone,rollover_time,rollover_mode,current_business_date,allow_pm_rollover,auto_clock_out";

constexpr const char* kFiscalColumns =
    "id,property_id,business_date,status,gross_sales,net_sales,tax_collected,discounts_total,"
    "tips_total,payment_total,check_count,guest_count,opened_at_ms,closed_at_ms,notes";

constexpr const char* kCheckColumns =
    "id,property_id,business_date,status,tax_cents,tip_cents,discount_cents,guest_count,revision,"
    "conflict_state,conflict_peer_id,canonical,displaced_holder,updated_at_ms";

constexpr const char* kPaymentColumns =
    "id,check_id,property_id,business_date,tender_type,amount_cents,tip_cents,created_at_ms";

constexpr const char* kTimeEntryColumns =
    "id,property_id,employee_id,business_date,clock_in_at_ms,clock_out_at_ms,source";

constexpr const char* kReplayColumns =
    "id,seq,entity_type,entity_id,operation,payload,created_at_ms,attempts,last_attempt_ms,status,error_message";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

// ------------------------------------------------------------------
// Properties
// ------------------------------------------------------------------

Result PgRepository::UpsertProperty(Transaction& t, const model::PropertyRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO properties(id,name,timezone,rollover_time,rollover_mode,current_business_date,allow_pm_rollover,auto_clock_out) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
        "ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,timezone=EXCLUDED.timezone,rollover_time=EXCLUDED.rollover_time,"
        "rollover_mode=EXCLUDED.rollover_mode,current_business_date=EXCLUDED.current_business_date,"
        "allow_pm_rollover=EXCLUDED.allow_pm_rollover,auto_clock_out=EXCLUDED.auto_clock_out;",
        r.id, r.name, r.timezone, r.rollover_time, static_cast<int>(r.rollover_mode), r.current_business_date, r.allow_pm_rollover,
        r.auto_clock_out);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PropertyRecord> PgRepository::GetProperty(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Select(kPropertyColumns, "FROM properties WHERE id=$1;"), id);
  if (res.empty()) return std::nullopt;
  return ReadProperty(res[0]);
}

std::vector<model::PropertyRecord> PgRepository::ListProperties(Transaction& t) {
  auto res = TX(t).Work().exec(Select(kPropertyColumns, "FROM properties ORDER BY id;"));

  std::vector<model::PropertyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadProperty(row));
  return out;
}

// ------------------------------------------------------------------
// Fiscal periods
// ------------------------------------------------------------------

Result PgRepository::InsertFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO fiscal_periods(id,property_id,business_date,status,gross_sales,net_sales,tax_collected,discounts_total,"
        "tips_total,payment_total,check_count,guest_count,opened_at_ms,closed_at_ms,notes) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15);",
        r.id, r.property_id, r.business_date, static_cast<int>(r.status), r.totals.gross_sales, r.totals.net_sales,
        r.totals.tax_collected, r.totals.discounts_total, r.totals.tips_total, r.totals.payment_total, r.totals.check_count,
        r.totals.guest_count, I64(r.opened_at_ms), I64(r.closed_at_ms), r.notes);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE fiscal_periods SET status=$2,gross_sales=$3,net_sales=$4,tax_collected=$5,discounts_total=$6,tips_total=$7,"
        "payment_total=$8,check_count=$9,guest_count=$10,opened_at_ms=$11,closed_at_ms=$12,notes=$13 WHERE id=$1;",
        r.id, static_cast<int>(r.status), r.totals.gross_sales, r.totals.net_sales, r.totals.tax_collected, r.totals.discounts_total,
        r.totals.tips_total, r.totals.payment_total, r.totals.check_count, r.totals.guest_count, I64(r.opened_at_ms),
        I64(r.closed_at_ms), r.notes);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "fiscal period not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FiscalPeriodRecord> PgRepository::GetFiscalPeriod(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Select(kFiscalColumns, "FROM fiscal_periods WHERE id=$1;"), id);
  if (res.empty()) return std::nullopt;
  return ReadFiscalPeriod(res[0]);
}

std::optional<model::FiscalPeriodRecord> PgRepository::GetFiscalPeriodByDate(Transaction& t, const std::string& property_id,
                                                                              const std::string& business_date) {
  auto res = TX(t).Work().exec_params(Select(kFiscalColumns, "FROM fiscal_periods WHERE property_id=$1 AND business_date=$2;"),
                                      property_id, business_date);
  if (res.empty()) return std::nullopt;
  return ReadFiscalPeriod(res[0]);
}

std::vector<model::FiscalPeriodRecord> PgRepository::ListFiscalPeriods(Transaction& t, const std::string& property_id) {
  auto res = TX(t).Work().exec_params(Select(kFiscalColumns, "FROM fiscal_periods WHERE property_id=$1 ORDER BY business_date ASC;"),
                                      property_id);

  std::vector<model::FiscalPeriodRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadFiscalPeriod(row));
  return out;
}

// ------------------------------------------------------------------
// Checks
// ------------------------------------------------------------------

std::vector<model::CheckRecord> PgRepository::ReadChecks(pqxx::work& w, const pqxx::result& res) {
  std::vector<model::CheckRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::CheckRecord r;
    r.id               = Text(row[0]);
    r.property_id      = Text(row[1]);
    r.business_date    = Text(row[2]);
    r.status           = static_cast<resync::v1::CheckStatus>(row[3].as<int>());
    r.tax_cents        = row[4].as<int64_t>();
    r.tip_cents        = row[5].as<int64_t>();
    r.discount_cents   = row[6].as<int64_t>();
    r.guest_count      = row[7].as<int64_t>();
    r.revision         = static_cast<uint64_t>(row[8].as<int64_t>());
    r.conflict_state   = static_cast<resync::v1::ConflictState>(row[9].as<int>());
    r.conflict_peer_id = Text(row[10]);
    r.canonical        = row[11].as<bool>();
    r.displaced_holder = Text(row[12]);
    r.updated_at_ms    = static_cast<uint64_t>(row[13].as<int64_t>());

    auto items = w.exec_prepared("get_line_items", r.id);
    for (const auto& item_row : items) {
      model::LineItemRecord item;
      item.id               = Text(item_row[0]);
      item.menu_item_id     = Text(item_row[1]);
      item.name             = Text(item_row[2]);
      item.quantity         = item_row[3].as<int64_t>();
      item.unit_price_cents = item_row[4].as<int64_t>();
      item.updated_at_ms    = static_cast<uint64_t>(item_row[5].as<int64_t>());
      r.line_items.push_back(std::move(item));
    }
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::UpsertCheck(Transaction& t, const model::CheckRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_params(
        "INSERT INTO checks(id,property_id,business_date,status,tax_cents,tip_cents,discount_cents,guest_count,revision,"
        "conflict_state,conflict_peer_id,canonical,displaced_holder,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) "
        "ON CONFLICT(id) DO UPDATE SET property_id=EXCLUDED.property_id,business_date=EXCLUDED.business_date,"
        "status=EXCLUDED.status,tax_cents=EXCLUDED.tax_cents,tip_cents=EXCLUDED.tip_cents,discount_cents=EXCLUDED.discount_cents,"
        "guest_count=EXCLUDED.guest_count,revision=EXCLUDED.revision,conflict_state=EXCLUDED.conflict_state,"
        "conflict_peer_id=EXCLUDED.conflict_peer_id,canonical=EXCLUDED.canonical,displaced_holder=EXCLUDED.displaced_holder,"
        "updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.property_id, r.business_date, static_cast<int>(r.status), r.tax_cents, r.tip_cents, r.discount_cents, r.guest_count,
        I64(r.revision), static_cast<int>(r.conflict_state), r.conflict_peer_id, r.canonical, r.displaced_holder, I64(r.updated_at_ms));

    w.exec_params("DELETE FROM check_line_items WHERE check_id=$1;", r.id);

    int position = 0;
    for (const auto& item : r.line_items) {
      w.exec_params(
          "INSERT INTO check_line_items(check_id,position,id,menu_item_id,name,quantity,unit_price_cents,updated_at_ms) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
          r.id, position++, item.id, item.menu_item_id, item.name, item.quantity, item.unit_price_cents, I64(item.updated_at_ms));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CheckRecord> PgRepository::GetCheck(Transaction& t, const std::string& id) {
  auto& w    = TX(t).Work();
  auto  rows = ReadChecks(w, w.exec_prepared("get_check", id));
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::CheckRecord> PgRepository::ListChecks(Transaction& t, const std::string& property_id,
                                                         const std::string& business_date) {
  auto& w = TX(t).Work();
  return ReadChecks(
      w, w.exec_params(Select(kCheckColumns, "FROM checks WHERE property_id=$1 AND business_date=$2 ORDER BY id;"), property_id,
                       business_date));
}

std::vector<model::CheckRecord> PgRepository::ListConflictedChecks(Transaction& t, const std::string& holder_id) {
  auto& w = TX(t).Work();
  return ReadChecks(w, w.exec_params(Select(kCheckColumns, "FROM checks WHERE conflict_state=$1 AND displaced_holder=$2 ORDER BY id;"),
                                     static_cast<int>(resync::v1::CONFLICT_STATE_PENDING), holder_id));
}

Result PgRepository::DeleteCheck(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM checks WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result PgRepository::UpsertPayment(Transaction& t, const model::PaymentRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO payments(id,check_id,property_id,business_date,tender_type,amount_cents,tip_cents,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
        "ON CONFLICT(id) DO UPDATE SET check_id=EXCLUDED.check_id,property_id=EXCLUDED.property_id,"
        "business_date=EXCLUDED.business_date,tender_type=EXCLUDED.tender_type,amount_cents=EXCLUDED.amount_cents,"
        "tip_cents=EXCLUDED.tip_cents,created_at_ms=EXCLUDED.created_at_ms;",
        r.id, r.check_id, r.property_id, r.business_date, r.tender_type, r.amount_cents, r.tip_cents, I64(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPayment(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Select(kPaymentColumns, "FROM payments WHERE id=$1;"), id);
  if (res.empty()) return std::nullopt;
  return ReadPayment(res[0]);
}

std::vector<model::PaymentRecord> PgRepository::ListPayments(Transaction& t, const std::string& property_id,
                                                             const std::string& business_date) {
  auto res = TX(t).Work().exec_params(Select(kPaymentColumns, "FROM payments WHERE property_id=$1 AND business_date=$2 ORDER BY id;"),
                                      property_id, business_date);

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPayment(row));
  return out;
}

Result PgRepository::DeletePayment(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM payments WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Time entries
// ------------------------------------------------------------------

Result PgRepository::UpsertTimeEntry(Transaction& t, const model::TimeEntryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO time_entries(id,property_id,employee_id,business_date,clock_in_at_ms,clock_out_at_ms,source) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(id) DO UPDATE SET property_id=EXCLUDED.property_id,employee_id=EXCLUDED.employee_id,"
        "business_date=EXCLUDED.business_date,clock_in_at_ms=EXCLUDED.clock_in_at_ms,"
        "clock_out_at_ms=EXCLUDED.clock_out_at_ms,source=EXCLUDED.source;",
        r.id, r.property_id, r.employee_id, r.business_date, I64(r.clock_in_at_ms), I64(r.clock_out_at_ms), r.source);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TimeEntryRecord> PgRepository::GetTimeEntry(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Select(kTimeEntryColumns, "FROM time_entries WHERE id=$1;"), id);
  if (res.empty()) return std::nullopt;
  return ReadTimeEntry(res[0]);
}

std::vector<model::TimeEntryRecord> PgRepository::ListOpenTimeEntries(Transaction& t, const std::string& property_id) {
  auto res = TX(t).Work().exec_params(
      Select(kTimeEntryColumns, "FROM time_entries WHERE property_id=$1 AND clock_out_at_ms=0 ORDER BY clock_in_at_ms ASC, id ASC;"),
      property_id);

  std::vector<model::TimeEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTimeEntry(row));
  return out;
}

Result PgRepository::DeleteTimeEntry(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM time_entries WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Replay queue
// ------------------------------------------------------------------

Result PgRepository::EnqueueReplay(Transaction& t, model::ReplayItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO replay_queue(id,entity_type,entity_id,operation,payload,created_at_ms,attempts,last_attempt_ms,status,error_message) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING seq;",
        r.id, static_cast<int>(r.entity_type), r.entity_id, static_cast<int>(r.operation), r.payload, I64(r.created_at_ms),
        static_cast<int64_t>(r.attempts), I64(r.last_attempt_ms), static_cast<int>(r.status), r.error_message);
    r.seq = static_cast<uint64_t>(res[0][0].as<int64_t>());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReplayItemRecord> PgRepository::ListReplayBatch(Transaction& t, uint32_t limit) {
  auto res = TX(t).Work().exec_prepared("replay_batch", static_cast<int>(resync::v1::REPLAY_STATUS_PENDING),
                                        static_cast<int>(resync::v1::REPLAY_STATUS_FAILED), static_cast<int64_t>(limit));

  std::vector<model::ReplayItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadReplay(row));
  return out;
}

std::vector<model::ReplayItemRecord> PgRepository::ListReplayHeads(Transaction& t, uint32_t limit) {
  auto res = TX(t).Work().exec_prepared("replay_heads", static_cast<int>(resync::v1::REPLAY_STATUS_PENDING),
                                        static_cast<int>(resync::v1::REPLAY_STATUS_FAILED),
                                        static_cast<int>(resync::v1::REPLAY_STATUS_COMPLETED), static_cast<int64_t>(limit));

  std::vector<model::ReplayItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadReplay(row));
  return out;
}

std::vector<model::ReplayItemRecord> PgRepository::ListReplayForEntity(Transaction& t, const std::string& entity_id) {
  auto res = TX(t).Work().exec_params(Select(kReplayColumns, "FROM replay_queue WHERE entity_id=$1 ORDER BY created_at_ms ASC, seq ASC;"),
                                      entity_id);

  std::vector<model::ReplayItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadReplay(row));
  return out;
}

Result PgRepository::UpdateReplay(Transaction& t, const model::ReplayItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("replay_update", r.id, r.payload, static_cast<int64_t>(r.attempts), I64(r.last_attempt_ms),
                                          static_cast<int>(r.status), r.error_message);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "replay item not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReplay(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("replay_delete", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::ResetSyncingReplay(Transaction& t) {
  auto res = TX(t).Work().exec_params("UPDATE replay_queue SET status=$1 WHERE status=$2;",
                                      static_cast<int>(resync::v1::REPLAY_STATUS_PENDING),
                                      static_cast<int>(resync::v1::REPLAY_STATUS_SYNCING));
  return static_cast<uint64_t>(res.affected_rows());
}

ReplayCounts PgRepository::CountReplay(Transaction& t) {
  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*), COALESCE(SUM(CASE WHEN status=$1 THEN 1 ELSE 0 END),0), COALESCE(MIN(created_at_ms),0) "
      "FROM replay_queue WHERE status<>$2;",
      static_cast<int>(resync::v1::REPLAY_STATUS_FAILED), static_cast<int>(resync::v1::REPLAY_STATUS_COMPLETED));

  ReplayCounts counts;
  if (!res.empty()) {
    counts.backlog           = static_cast<uint64_t>(res[0][0].as<int64_t>());
    counts.failed            = static_cast<uint64_t>(res[0][1].as<int64_t>());
    counts.oldest_created_ms = static_cast<uint64_t>(res[0][2].as<int64_t>());
  }
  return counts;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO audit_log(id,action,target_type,target_id,actor_id,details,created_at_ms) VALUES($1,$2,$3,$4,$5,$6::jsonb,$7);",
        r.id, r.action, r.target_type, r.target_id, r.actor_id, r.details.empty() ? std::string("{}") : r.details, I64(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAudit(Transaction& t, const std::string& target_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,action,target_type,target_id,actor_id,details::text,created_at_ms FROM audit_log WHERE target_id=$1 ORDER BY seq ASC;",
      target_id);

  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AuditRecord r;
    r.id            = Text(row[0]);
    r.action        = Text(row[1]);
    r.target_type   = Text(row[2]);
    r.target_id     = Text(row[3]);
    r.actor_id      = Text(row[4]);
    r.details       = Text(row[5]);
    r.created_at_ms = static_cast<uint64_t>(row[6].as<int64_t>());
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace resync::db::postgres
