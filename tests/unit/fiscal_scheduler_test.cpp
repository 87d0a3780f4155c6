#include "internal/fiscal/fiscal_scheduler.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using resync::db::memory::MemoryRepository;
using resync::db::model::CheckRecord;
using resync::db::model::FiscalPeriodRecord;
using resync::db::model::PaymentRecord;
using resync::db::model::PropertyRecord;
using resync::db::model::TimeEntryRecord;
using resync::fiscal::FiscalScheduler;
using resync::util::ManualClock;

resync::util::TimePoint NewYork(int y, int mo, int d, int h, int mi) {
  absl::TimeZone tz;
  const bool     loaded = absl::LoadTimeZone("America/New_York", &tz);
  assert(loaded);
  return absl::ToChronoTime(absl::FromCivil(absl::CivilSecond(y, mo, d, h, mi, 0), tz));
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>();
  FiscalScheduler                   scheduler{repo, clock};

  void AddProperty(const std::string& id, resync::v1::RolloverMode mode = resync::v1::ROLLOVER_MODE_AUTO, bool auto_clock_out = false) {
    PropertyRecord property;
    property.id             = id;
    property.name           = id;
    property.timezone       = "America/New_York";
    property.rollover_time  = "04:00";
    property.rollover_mode  = mode;
    property.auto_clock_out = auto_clock_out;

    auto tx = repo->Begin();
    assert(repo->UpsertProperty(*tx, property));
    tx->Commit();
  }

  void OpenPeriod(const std::string& property_id, const std::string& date,
                  resync::v1::FiscalPeriodStatus status = resync::v1::FISCAL_PERIOD_STATUS_OPEN) {
    FiscalPeriodRecord period;
    period.id            = property_id + "-" + date;
    period.property_id   = property_id;
    period.business_date = date;
    period.status        = status;

    auto tx = repo->Begin();
    assert(repo->InsertFiscalPeriod(*tx, period));
    tx->Commit();
  }

  std::vector<FiscalPeriodRecord> Periods(const std::string& property_id) {
    auto tx      = repo->Begin();
    auto periods = repo->ListFiscalPeriods(*tx, property_id);
    tx->Commit();
    return periods;
  }
};

CheckRecord MakeCheck(const std::string& id, const std::string& date, int64_t unit_price, int64_t quantity) {
  CheckRecord check;
  check.id            = id;
  check.property_id   = "downtown";
  check.business_date = date;
  check.revision      = 1;
  check.tax_cents     = 80;
  check.guest_count   = 2;
  check.line_items.push_back({.id = id + "-li", .menu_item_id = "burger", .name = "Burger", .quantity = quantity, .unit_price_cents = unit_price});
  return check;
}

void TestBacklogClosesOldestFirst() {
  Fixture f;
  f.AddProperty("downtown");
  f.OpenPeriod("downtown", "2026-01-02");
  f.clock->Set(NewYork(2026, 1, 5, 10, 0));

  const auto closed = f.scheduler.ProcessProperty("downtown");
  assert((closed == std::vector<std::string>{"2026-01-02", "2026-01-03", "2026-01-04"}));

  const auto periods = f.Periods("downtown");
  assert(periods.size() == 4);
  for (size_t i = 0; i < 3; ++i) {
    assert(periods[i].status == resync::v1::FISCAL_PERIOD_STATUS_CLOSED);
    assert(periods[i].notes == resync::fiscal::kAutoCloseNote);
  }
  assert(periods[3].business_date == "2026-01-05");
  assert(periods[3].status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);

  auto tx       = f.repo->Begin();
  auto property = f.repo->GetProperty(*tx, "downtown");
  tx->Commit();
  assert(property->current_business_date == "2026-01-05");
}

void TestBacklogBeyondIterationLimitResumes() {
  Fixture f;
  f.AddProperty("downtown");
  f.OpenPeriod("downtown", "2026-01-01");
  f.clock->Set(NewYork(2026, 1, 6, 10, 0));

  FiscalScheduler capped(f.repo, f.clock, {.max_iterations = 2});
  assert((capped.ProcessProperty("downtown") == std::vector<std::string>{"2026-01-01", "2026-01-02"}));

  // Stopped at the cap: the next open period is the oldest one left.
  auto periods = f.Periods("downtown");
  assert(periods.size() == 3);
  assert(periods[2].business_date == "2026-01-03");
  assert(periods[2].status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);

  assert((capped.ProcessProperty("downtown") == std::vector<std::string>{"2026-01-03", "2026-01-04"}));
  assert(capped.RunOnce() == 1);
  assert(capped.RunOnce() == 0);

  periods = f.Periods("downtown");
  assert(periods.size() == 6);
  for (size_t i = 0; i < 5; ++i) {
    assert(periods[i].status == resync::v1::FISCAL_PERIOD_STATUS_CLOSED);
    if (i > 0) assert(periods[i - 1].closed_at_ms <= periods[i].closed_at_ms);
  }
  assert(periods[5].business_date == "2026-01-06");
  assert(periods[5].status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);
}

void TestClosedPeriodBetweenOpenOnes() {
  Fixture f;
  f.AddProperty("downtown");
  f.OpenPeriod("downtown", "2026-01-02");
  f.OpenPeriod("downtown", "2026-01-03", resync::v1::FISCAL_PERIOD_STATUS_CLOSED);
  f.OpenPeriod("downtown", "2026-01-04");
  f.clock->Set(NewYork(2026, 1, 5, 10, 0));

  assert((f.scheduler.ProcessProperty("downtown") == std::vector<std::string>{"2026-01-02", "2026-01-04"}));

  const auto periods = f.Periods("downtown");
  assert(periods.size() == 4);
  // Already closed by hand; left as it was.
  assert(periods[1].business_date == "2026-01-03");
  assert(periods[1].notes.empty());
  assert(periods[1].closed_at_ms == 0);
  assert(periods[3].business_date == "2026-01-05");
  assert(periods[3].status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);
}

void TestNothingClosesBeforeRollover() {
  Fixture f;
  f.AddProperty("downtown");
  f.OpenPeriod("downtown", "2026-01-04");
  f.clock->Set(NewYork(2026, 1, 5, 3, 59));

  assert(f.scheduler.RunOnce() == 0);

  f.clock->Set(NewYork(2026, 1, 5, 4, 0));
  assert(f.scheduler.RunOnce() == 1);
  assert(f.scheduler.RunOnce() == 0);
}

void TestFirstRunOpensCurrentPeriod() {
  Fixture f;
  f.AddProperty("downtown");
  f.clock->Set(NewYork(2026, 1, 5, 2, 30));

  assert(f.scheduler.RunOnce() == 0);

  const auto periods = f.Periods("downtown");
  assert(periods.size() == 1);
  assert(periods[0].business_date == "2026-01-04");
  assert(periods[0].status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);
}

void TestManualPropertiesAreSkipped() {
  Fixture f;
  f.AddProperty("manual", resync::v1::ROLLOVER_MODE_MANUAL);
  f.OpenPeriod("manual", "2026-01-02");
  f.clock->Set(NewYork(2026, 1, 5, 10, 0));

  assert(f.scheduler.RunOnce() == 0);
  assert(f.Periods("manual").front().status == resync::v1::FISCAL_PERIOD_STATUS_OPEN);
}

void TestTotalsExcludeNonCanonicalChecks() {
  Fixture f;
  f.AddProperty("downtown");
  f.OpenPeriod("downtown", "2026-01-04");

  auto tx = f.repo->Begin();

  auto paid = MakeCheck("paid", "2026-01-04", 1000, 2);
  paid.discount_cents = 200;
  assert(f.repo->UpsertCheck(*tx, paid));

  auto cash_tip      = MakeCheck("unpaid", "2026-01-04", 500, 1);
  cash_tip.tip_cents = 100;
  assert(f.repo->UpsertCheck(*tx, cash_tip));

  auto clone           = MakeCheck("clone", "2026-01-04", 9999, 1);
  clone.canonical      = false;
  clone.conflict_state = resync::v1::CONFLICT_STATE_CLONE;
  assert(f.repo->UpsertCheck(*tx, clone));

  PaymentRecord payment{.id = "pay-1", .check_id = "paid", .property_id = "downtown", .business_date = "2026-01-04",
                        .tender_type = "card", .amount_cents = 1880, .tip_cents = 300};
  assert(f.repo->UpsertPayment(*tx, payment));

  PaymentRecord clone_payment{.id = "pay-2", .check_id = "clone", .property_id = "downtown", .business_date = "2026-01-04",
                              .tender_type = "cash", .amount_cents = 9999};
  assert(f.repo->UpsertPayment(*tx, clone_payment));

  const auto totals = f.scheduler.ComputeTotals(*tx, "downtown", "2026-01-04");
  tx->Commit();

  assert(totals.gross_sales == 2500);
  assert(totals.discounts_total == 200);
  assert(totals.net_sales == 2300);
  assert(totals.tax_collected == 160);
  assert(totals.tips_total == 400);
  assert(totals.payment_total == 1880);
  assert(totals.check_count == 2);
  assert(totals.guest_count == 4);
}

void TestAutoClockOutAtRollover() {
  Fixture f;
  f.AddProperty("downtown", resync::v1::ROLLOVER_MODE_AUTO, true);
  f.OpenPeriod("downtown", "2026-01-04");

  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertTimeEntry(*tx, TimeEntryRecord{.id = "te-old", .property_id = "downtown", .employee_id = "emp-1",
                                                        .business_date = "2026-01-04", .clock_in_at_ms = 1}));
    assert(f.repo->UpsertTimeEntry(*tx, TimeEntryRecord{.id = "te-new", .property_id = "downtown", .employee_id = "emp-2",
                                                        .business_date = "2026-01-05", .clock_in_at_ms = 2}));
    tx->Commit();
  }

  f.clock->Set(NewYork(2026, 1, 5, 4, 30));
  assert(f.scheduler.RunOnce() == 1);

  auto tx   = f.repo->Begin();
  auto open = f.repo->ListOpenTimeEntries(*tx, "downtown");
  assert(open.size() == 1);
  assert(open[0].id == "te-new");

  auto closed = f.repo->GetTimeEntry(*tx, "te-old");
  assert(closed->clock_out_at_ms == resync::util::ToUnixMillis(f.clock->Now()));

  auto audit = f.repo->ListAudit(*tx, "te-old");
  assert(audit.size() == 1);
  assert(audit[0].action == "auto_clock_out");
  assert(audit[0].actor_id == "fiscal-scheduler");
  tx->Commit();
}

} // namespace

int main() {
  TestBacklogClosesOldestFirst();
  TestBacklogBeyondIterationLimitResumes();
  TestClosedPeriodBetweenOpenOnes();
  TestNothingClosesBeforeRollover();
  TestFirstRunOpensCurrentPeriod();
  TestManualPropertiesAreSkipped();
  TestTotalsExcludeNonCanonicalChecks();
  TestAutoClockOutAtRollover();

  std::cout << "resync_unit_fiscal_scheduler: pass\n";
  return 0;
}
