#pragma once

#include <cstdint>
#include <string>

#include "resync/v1/types.pb.h"

namespace resync::db::model {

/*
  Pending mutation awaiting acknowledgment by the authoritative store.

  Ordered by (created_at_ms, seq). seq is a per-store monotonic tiebreaker
  assigned at enqueue.
*/
struct ReplayItemRecord {
  std::string id;
  uint64_t    seq = 0;

  resync::v1::EntityType      entity_type = resync::v1::ENTITY_TYPE_UNSPECIFIED;
  std::string                 entity_id;
  resync::v1::ReplayOperation operation = resync::v1::REPLAY_OPERATION_UNSPECIFIED;

  // JSON of the entity message
  std::string payload;

  uint64_t created_at_ms   = 0;
  uint32_t attempts        = 0;
  uint64_t last_attempt_ms = 0;

  resync::v1::ReplayStatus status = resync::v1::REPLAY_STATUS_PENDING;
  std::string              error_message;
};

} // namespace resync::db::model
