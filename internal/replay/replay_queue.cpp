#include "replay_queue.hpp"

#include <stdexcept>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resync::replay {

using namespace resync::v1;

ReplayQueue::ReplayQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_ || !clock_) {
    throw std::invalid_argument("ReplayQueue requires repository and clock");
  }
}

std::string ReplayQueue::Enqueue(EntityType entity_type, const std::string& entity_id, ReplayOperation operation, const std::string& payload) {
  auto tx = repository_->Begin();
  auto id = Enqueue(*tx, entity_type, entity_id, operation, payload);
  tx->Commit();
  return id;
}

std::string ReplayQueue::Enqueue(db::Transaction& tx, EntityType entity_type, const std::string& entity_id, ReplayOperation operation,
                                 const std::string& payload) {
  if (entity_type == ENTITY_TYPE_UNSPECIFIED) throw util::InvalidArgument("replay entity_type is required");
  if (operation == REPLAY_OPERATION_UNSPECIFIED) throw util::InvalidArgument("replay operation is required");
  if (entity_id.empty()) throw util::InvalidArgument("replay entity_id is required");

  db::model::ReplayItemRecord record;
  record.id            = util::NewId();
  record.entity_type   = entity_type;
  record.entity_id     = entity_id;
  record.operation     = operation;
  record.payload       = payload;
  record.created_at_ms = util::ToUnixMillis(clock_->Now());
  record.status        = REPLAY_STATUS_PENDING;

  db::ThrowIfDbError(repository_->EnqueueReplay(tx, record), "enqueue replay");
  return record.id;
}

std::vector<db::model::ReplayItemRecord> ReplayQueue::NextBatch(uint32_t limit) {
  auto tx    = repository_->Begin();
  auto batch = repository_->ListReplayBatch(*tx, limit);
  tx->Commit();
  return batch;
}

std::vector<db::model::ReplayItemRecord> ReplayQueue::NextHeads(uint32_t limit) {
  auto tx    = repository_->Begin();
  auto heads = repository_->ListReplayHeads(*tx, limit);
  tx->Commit();
  return heads;
}

std::vector<db::model::ReplayItemRecord> ReplayQueue::PendingForEntity(const std::string& entity_id) {
  auto tx    = repository_->Begin();
  auto items = repository_->ListReplayForEntity(*tx, entity_id);
  tx->Commit();

  std::erase_if(items, [](const db::model::ReplayItemRecord& item) { return item.status == REPLAY_STATUS_COMPLETED; });
  return items;
}

void ReplayQueue::MarkSyncing(db::model::ReplayItemRecord& item) {
  item.status          = REPLAY_STATUS_SYNCING;
  item.last_attempt_ms = util::ToUnixMillis(clock_->Now());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateReplay(*tx, item), "mark replay syncing");
  tx->Commit();
}

void ReplayQueue::MarkFailed(db::model::ReplayItemRecord& item, const std::string& error) {
  item.status          = REPLAY_STATUS_FAILED;
  item.attempts        = item.attempts + 1;
  item.last_attempt_ms = util::ToUnixMillis(clock_->Now());
  item.error_message   = error;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateReplay(*tx, item), "mark replay failed");
  tx->Commit();
}

void ReplayQueue::Complete(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteReplay(*tx, id), "complete replay");
  tx->Commit();
}

uint64_t ReplayQueue::ResetInFlight() {
  auto tx      = repository_->Begin();
  auto touched = repository_->ResetSyncingReplay(*tx);
  tx->Commit();

  if (touched > 0) {
    RESYNC_LOG_WARN("Replay items left in flight returned to pending", {observability::IntField("items", static_cast<int64_t>(touched))});
  }
  return touched;
}

QueueStats ReplayQueue::Stats() {
  auto tx     = repository_->Begin();
  auto counts = repository_->CountReplay(*tx);
  tx->Commit();

  QueueStats stats;
  stats.backlog = counts.backlog;
  stats.failed  = counts.failed;
  if (counts.oldest_created_ms > 0) {
    const auto now_ms = util::ToUnixMillis(clock_->Now());
    if (now_ms > counts.oldest_created_ms) stats.oldest_pending_age = std::chrono::milliseconds(now_ms - counts.oldest_created_ms);
  }
  return stats;
}

} // namespace resync::replay
