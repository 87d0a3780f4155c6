#pragma once

#include <cstdint>
#include <string>

#include "resync/v1/types.pb.h"

namespace resync::db::model {

// Aggregates in integer cents.
struct FiscalTotals {
  int64_t gross_sales     = 0;
  int64_t net_sales       = 0;
  int64_t tax_collected   = 0;
  int64_t discounts_total = 0;
  int64_t tips_total      = 0;
  int64_t payment_total   = 0;
  int64_t check_count     = 0;
  int64_t guest_count     = 0;
};

/*
  One business date of one property.

  At most one non-closed period per (property_id, business_date);
  periods close strictly in increasing business_date order.
*/
struct FiscalPeriodRecord {
  std::string id;
  std::string property_id;
  std::string business_date;

  resync::v1::FiscalPeriodStatus status = resync::v1::FISCAL_PERIOD_STATUS_OPEN;

  FiscalTotals totals;

  uint64_t    opened_at_ms = 0;
  uint64_t    closed_at_ms = 0;
  std::string notes;
};

} // namespace resync::db::model
