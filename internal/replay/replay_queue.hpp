#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace resync::replay {

struct QueueStats {
  uint64_t                  backlog = 0;
  uint64_t                  failed  = 0;
  std::chrono::milliseconds oldest_pending_age{0};
};

/*
  Durable write-ahead queue of local mutations.

  Items are appended in the same transaction as the local entity write and
  stay until the authoritative store acknowledges them. Failed items keep
  their error and are retried on every drain; there is no retry cap.
*/
class ReplayQueue {
 public:
  ReplayQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  // Returns the queue id.
  std::string Enqueue(resync::v1::EntityType entity_type, const std::string& entity_id, resync::v1::ReplayOperation operation,
                      const std::string& payload);

  // Appends inside the caller's transaction.
  std::string Enqueue(db::Transaction& tx, resync::v1::EntityType entity_type, const std::string& entity_id,
                      resync::v1::ReplayOperation operation, const std::string& payload);

  // Pending and failed items, oldest first.
  std::vector<db::model::ReplayItemRecord> NextBatch(uint32_t limit);

  // The next dispatchable item of each entity with queued work. Entities that
  // have not failed come before ones that have, so a stuck entity cannot
  // starve the rest of the queue.
  std::vector<db::model::ReplayItemRecord> NextHeads(uint32_t limit);

  // Items of one entity still awaiting acknowledgment, oldest first.
  std::vector<db::model::ReplayItemRecord> PendingForEntity(const std::string& entity_id);

  void MarkSyncing(db::model::ReplayItemRecord& item);
  void MarkFailed(db::model::ReplayItemRecord& item, const std::string& error);
  void Complete(const std::string& id);

  // Returns items a crash left in syncing to pending.
  uint64_t ResetInFlight();

  QueueStats Stats();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace resync::replay
