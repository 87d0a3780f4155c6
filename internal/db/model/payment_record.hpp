#pragma once

#include <cstdint>
#include <string>

namespace resync::db::model {

struct PaymentRecord {
  std::string id;
  std::string check_id;
  std::string property_id;
  std::string business_date;
  std::string tender_type;
  int64_t     amount_cents  = 0;
  int64_t     tip_cents     = 0;
  uint64_t    created_at_ms = 0;
};

} // namespace resync::db::model
