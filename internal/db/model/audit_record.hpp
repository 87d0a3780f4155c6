#pragma once

#include <cstdint>
#include <string>

namespace resync::db::model {

struct AuditRecord {
  std::string id;
  std::string action;
  std::string target_type;
  std::string target_id;
  std::string actor_id;
  // JSON object
  std::string details;
  uint64_t    created_at_ms = 0;
};

} // namespace resync::db::model
