#include "fiscal_scheduler.hpp"

#include <google/protobuf/struct.pb.h>

#include <stdexcept>
#include <unordered_set>

#include "internal/businessdate/business_date.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resync::fiscal {

using namespace resync::v1;

namespace {

constexpr const char* kSchedulerActor = "fiscal-scheduler";

bool IsOpen(const db::model::FiscalPeriodRecord& period) {
  return period.status != FISCAL_PERIOD_STATUS_CLOSED;
}

db::model::FiscalPeriodRecord NewPeriod(const std::string& property_id, const std::string& business_date, uint64_t now_ms) {
  db::model::FiscalPeriodRecord period;
  period.id            = util::NewId();
  period.property_id   = property_id;
  period.business_date = business_date;
  period.status        = FISCAL_PERIOD_STATUS_OPEN;
  period.opened_at_ms  = now_ms;
  return period;
}

} // namespace

FiscalScheduler::FiscalScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, FiscalSchedulerOptions options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
  if (!repository_ || !clock_) {
    throw std::invalid_argument("FiscalScheduler requires repository and clock");
  }
  if (options_.max_iterations == 0) options_.max_iterations = 30;
}

std::size_t FiscalScheduler::RunOnce() {
  observability::SpanScope span("fiscal.tick");

  std::vector<db::model::PropertyRecord> properties;
  {
    auto tx    = repository_->Begin();
    properties = repository_->ListProperties(*tx);
    tx->Commit();
  }

  std::size_t closed = 0;
  for (const auto& property : properties) {
    if (property.rollover_mode != ROLLOVER_MODE_AUTO) continue;
    try {
      closed += ProcessProperty(property.id).size();
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      RESYNC_LOG_ERROR("Fiscal rollover failed for property",
                       {observability::StringField("property_id", property.id), observability::StringField("error", e.what())});
    }
  }

  span.SetAttribute("closed", static_cast<std::int64_t>(closed));
  return closed;
}

std::vector<std::string> FiscalScheduler::ProcessProperty(const std::string& property_id) {
  std::vector<std::string> closed;

  for (uint32_t iteration = 0; iteration < options_.max_iterations; ++iteration) {
    std::string date;
    const auto  result = Step(property_id, &date);
    if (result == StepResult::kIdle) return closed;
    if (result == StepResult::kClosed) closed.push_back(date);
  }

  RESYNC_LOG_WARN("Fiscal rollover stopped at iteration limit",
                  {observability::StringField("property_id", property_id), observability::IntField("max_iterations", options_.max_iterations)});
  return closed;
}

FiscalScheduler::StepResult FiscalScheduler::Step(const std::string& property_id, std::string* closed_date) {
  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx       = repository_->Begin();
  auto property = repository_->GetProperty(*tx, property_id);
  if (!property) throw util::NotFound("property " + property_id + " not found");

  auto periods = repository_->ListFiscalPeriods(*tx, property_id);
  std::erase_if(periods, [](const db::model::FiscalPeriodRecord& p) { return !IsOpen(p); });

  if (periods.empty()) {
    const auto date = businessdate::ResolveBusinessDate(now, *property);
    if (!repository_->GetFiscalPeriodByDate(*tx, property_id, date)) {
      db::ThrowIfDbError(repository_->InsertFiscalPeriod(*tx, NewPeriod(property_id, date, now_ms)), "open fiscal period");
      RESYNC_LOG_INFO("Opened fiscal period", {observability::StringField("property_id", property_id),
                                               observability::StringField("business_date", date)});
    }
    tx->Commit();
    return StepResult::kIdle;
  }

  const auto& oldest  = periods.front();
  const auto  current = businessdate::DeriveBusinessDate(now, *property);
  if (current <= oldest.business_date) {
    tx->Rollback();
    return StepResult::kIdle;
  }

  // Re-read inside the closing transaction; another closer may have won.
  auto period = repository_->GetFiscalPeriod(*tx, oldest.id);
  if (!period || !IsOpen(*period)) {
    tx->Rollback();
    return StepResult::kSkipped;
  }

  if (property->auto_clock_out) AutoClockOut(*tx, *property, period->business_date, now_ms);

  period->totals       = ComputeTotals(*tx, property_id, period->business_date);
  period->status       = FISCAL_PERIOD_STATUS_CLOSED;
  period->closed_at_ms = now_ms;
  period->notes        = kAutoCloseNote;
  db::ThrowIfDbError(repository_->UpdateFiscalPeriod(*tx, *period), "close fiscal period");

  const auto next                  = businessdate::IncrementDate(period->business_date);
  property->current_business_date = next;
  db::ThrowIfDbError(repository_->UpsertProperty(*tx, *property), "advance business date");

  if (!repository_->GetFiscalPeriodByDate(*tx, property_id, next)) {
    db::ThrowIfDbError(repository_->InsertFiscalPeriod(*tx, NewPeriod(property_id, next, now_ms)), "open next fiscal period");
  }

  tx->Commit();

  observability::Metrics::Instance().RecordFiscalClose(property_id);
  RESYNC_LOG_INFO("Closed fiscal period", {observability::StringField("property_id", property_id),
                                           observability::StringField("business_date", period->business_date),
                                           observability::IntField("net_sales_cents", period->totals.net_sales),
                                           observability::IntField("checks", period->totals.check_count)});

  *closed_date = period->business_date;
  return StepResult::kClosed;
}

void FiscalScheduler::AutoClockOut(db::Transaction& tx, const db::model::PropertyRecord& property, const std::string& business_date,
                                   uint64_t now_ms) {
  for (auto entry : repository_->ListOpenTimeEntries(tx, property.id)) {
    if (entry.business_date > business_date) continue;

    entry.clock_out_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpsertTimeEntry(tx, entry), "auto clock-out");

    google::protobuf::Struct details;
    (*details.mutable_fields())["employee_id"].set_string_value(entry.employee_id);
    (*details.mutable_fields())["business_date"].set_string_value(entry.business_date);

    db::model::AuditRecord audit;
    audit.id            = util::NewId();
    audit.action        = "auto_clock_out";
    audit.target_type   = "time_entry";
    audit.target_id     = entry.id;
    audit.actor_id      = kSchedulerActor;
    audit.details       = db::model::ToJson(details);
    audit.created_at_ms = now_ms;
    db::ThrowIfDbError(repository_->InsertAudit(tx, audit), "audit auto clock-out");

    RESYNC_LOG_INFO("Auto clock-out at rollover", {observability::StringField("property_id", property.id),
                                                   observability::StringField("employee_id", entry.employee_id)});
  }
}

db::model::FiscalTotals FiscalScheduler::ComputeTotals(db::Transaction& tx, const std::string& property_id, const std::string& business_date) {
  db::model::FiscalTotals totals;

  const auto checks = repository_->ListChecks(tx, property_id, business_date);

  std::unordered_set<std::string> retired;
  std::unordered_set<std::string> counted;
  for (const auto& check : checks) {
    if (!check.canonical || check.conflict_state == CONFLICT_STATE_RESOLVED) {
      retired.insert(check.id);
      continue;
    }
    counted.insert(check.id);

    totals.gross_sales += db::model::SubtotalCents(check);
    totals.discounts_total += check.discount_cents;
    totals.tax_collected += check.tax_cents;
    totals.guest_count += check.guest_count;
    totals.check_count++;
  }

  // Tips are taken from payments; a check without payments contributes its own tip.
  std::unordered_set<std::string> paid;
  for (const auto& payment : repository_->ListPayments(tx, property_id, business_date)) {
    if (retired.contains(payment.check_id)) continue;
    totals.payment_total += payment.amount_cents;
    totals.tips_total += payment.tip_cents;
    paid.insert(payment.check_id);
  }
  for (const auto& check : checks) {
    if (counted.contains(check.id) && !paid.contains(check.id)) totals.tips_total += check.tip_cents;
  }

  totals.net_sales = totals.gross_sales - totals.discounts_total;
  return totals;
}

} // namespace resync::fiscal
