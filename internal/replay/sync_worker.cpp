#include "sync_worker.hpp"

#include <stdexcept>
#include <unordered_set>

#include "internal/db/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace resync::replay {

using namespace resync::v1;

namespace {

std::string_view EntityName(EntityType type) {
  switch (type) {
    case ENTITY_TYPE_CHECK:
      return "check";
    case ENTITY_TYPE_PAYMENT:
      return "payment";
    case ENTITY_TYPE_TIME_ENTRY:
      return "time_entry";
    default:
      return "unknown";
  }
}

} // namespace

SyncWorker::SyncWorker(std::shared_ptr<ReplayQueue> queue, std::shared_ptr<connectivity::ConnectivityMonitor> monitor,
                       std::shared_ptr<AuthoritativeStore> cloud, std::shared_ptr<AuthoritativeStore> relay_host, SyncWorkerOptions options)
    : queue_(std::move(queue)), monitor_(std::move(monitor)), cloud_(std::move(cloud)), relay_host_(std::move(relay_host)), options_(options) {
  if (!queue_ || !monitor_) {
    throw std::invalid_argument("SyncWorker requires a replay queue and a connectivity monitor");
  }
  if (options_.batch_size == 0) options_.batch_size = 10;
}

AuthoritativeStore* SyncWorker::Target() const {
  switch (monitor_->Mode()) {
    case CONNECTION_MODE_ONLINE:
      return cloud_.get();
    case CONNECTION_MODE_LAN_DEGRADED:
      return relay_host_.get();
    default:
      return nullptr;
  }
}

bool SyncWorker::Dispatch(AuthoritativeStore& store, db::model::ReplayItemRecord& item) {
  const auto entity = EntityName(item.entity_type);

  queue_->MarkSyncing(item);
  try {
    store.Apply(db::model::ToProto(item), options_.dispatch_timeout);
  } catch (const std::exception& e) {
    queue_->MarkFailed(item, e.what());
    observability::Metrics::Instance().RecordReplayDispatch(entity, false);
    RESYNC_LOG_WARN("Replay dispatch failed", {observability::StringField("replay_id", item.id),
                                               observability::StringField("entity_id", item.entity_id),
                                               observability::IntField("attempts", item.attempts),
                                               observability::StringField("error", e.what())});
    return false;
  }

  queue_->Complete(item.id);
  observability::Metrics::Instance().RecordReplayDispatch(entity, true);
  return true;
}

void SyncWorker::PublishBacklog() {
  observability::Metrics::Instance().SetReplayBacklog(queue_->Stats().backlog);
}

std::size_t SyncWorker::RunOnce() {
  std::lock_guard lock(drain_mutex_);

  auto* store = Target();
  if (!store) {
    PublishBacklog();
    return 0;
  }

  observability::SpanScope span("replay.drain");

  // Each pass takes the head of every entity with queued work, so a success
  // exposes that entity's next item to the following pass. Entities that
  // failed during this drain are skipped until the next one.
  std::unordered_set<std::string> blocked;
  std::size_t                     attempted = 0;
  std::size_t                     completed = 0;
  while (attempted < options_.batch_size) {
    auto heads = queue_->NextHeads(options_.batch_size + static_cast<uint32_t>(blocked.size()));

    std::size_t tried = 0;
    for (auto& item : heads) {
      if (attempted == options_.batch_size) break;
      if (blocked.contains(item.entity_id)) continue;
      ++attempted;
      ++tried;
      if (Dispatch(*store, item)) {
        ++completed;
      } else {
        blocked.insert(item.entity_id);
      }
    }
    if (tried == 0) break;
  }

  span.SetAttribute("completed", static_cast<std::int64_t>(completed));
  if (attempted > 0) {
    RESYNC_LOG_DEBUG("Replay drain pass", {observability::IntField("attempted", static_cast<int64_t>(attempted)),
                                           observability::IntField("completed", static_cast<int64_t>(completed))});
  }

  PublishBacklog();
  return completed;
}

std::size_t SyncWorker::DrainEntity(const std::string& entity_id) {
  std::lock_guard lock(drain_mutex_);

  auto items = queue_->PendingForEntity(entity_id);
  if (items.empty()) return 0;

  auto* store = Target();
  if (!store) return items.size();

  std::size_t done = 0;
  for (auto& item : items) {
    if (!Dispatch(*store, item)) break;
    ++done;
  }

  PublishBacklog();
  return items.size() - done;
}

} // namespace resync::replay
