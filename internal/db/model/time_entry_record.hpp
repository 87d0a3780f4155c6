#pragma once

#include <cstdint>
#include <string>

namespace resync::db::model {

// clock_out_at_ms == 0 means the employee is still clocked in.
struct TimeEntryRecord {
  std::string id;
  std::string property_id;
  std::string employee_id;
  std::string business_date;
  uint64_t    clock_in_at_ms  = 0;
  uint64_t    clock_out_at_ms = 0;
  std::string source;
};

} // namespace resync::db::model
