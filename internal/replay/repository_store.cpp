#include "repository_store.hpp"

#include <stdexcept>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/db/api/db_errors.hpp"
#include "internal/db/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resync::replay {

using namespace resync::v1;

namespace {

template <typename Message>
Message Decode(const ReplayItem& item) {
  Message message;
  db::model::FromJson(item.payload(), &message);
  if (message.id().empty()) message.set_id(item.entity_id());
  if (message.id() != item.entity_id()) {
    throw util::InvalidArgument("replay payload id " + message.id() + " does not match entity " + item.entity_id());
  }
  return message;
}

// True when this replay item was already kept as a divergent clone of the
// check and only its acknowledgment was lost.
bool AlreadyKept(db::Repository& repository, db::Transaction& tx, const std::string& check_id, const std::string& replay_id) {
  for (const auto& entry : repository.ListAudit(tx, check_id)) {
    if (entry.action != "replay_divergent_write") continue;
    google::protobuf::Struct details;
    db::model::FromJson(entry.details, &details);
    const auto it = details.fields().find("replay_id");
    if (it != details.fields().end() && it->second.string_value() == replay_id) return true;
  }
  return false;
}

} // namespace

RepositoryStore::RepositoryStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_ || !clock_) {
    throw std::invalid_argument("RepositoryStore requires a repository and a clock");
  }
}

uint64_t RepositoryStore::Apply(const ReplayItem& item, std::chrono::milliseconds) {
  if (item.entity_id().empty()) throw util::InvalidArgument("replay item has no entity_id");

  auto     tx       = repository_->Begin();
  uint64_t revision = 0;

  switch (item.entity_type()) {
    case ENTITY_TYPE_CHECK:
      revision = ApplyCheck(*tx, item);
      break;
    case ENTITY_TYPE_PAYMENT:
      ApplyPayment(*tx, item);
      break;
    case ENTITY_TYPE_TIME_ENTRY:
      ApplyTimeEntry(*tx, item);
      break;
    default:
      throw util::InvalidArgument("replay item has no entity_type");
  }

  tx->Commit();
  return revision;
}

uint64_t RepositoryStore::ApplyCheck(db::Transaction& tx, const ReplayItem& item) {
  if (item.operation() == REPLAY_OPERATION_DELETE) {
    db::ThrowIfDbError(repository_->DeleteCheck(tx, item.entity_id()), "delete check");
    return 0;
  }

  auto incoming = db::model::CheckFromProto(Decode<Check>(item));
  auto stored   = repository_->GetCheck(tx, incoming.id);

  if (stored) {
    if (incoming.revision < stored->revision) {
      if (AlreadyKept(*repository_, tx, stored->id, item.id())) return stored->revision;
      if (stored->conflict_state != CONFLICT_STATE_NONE) {
        throw util::LockConflict("check " + incoming.id + " revision " + std::to_string(incoming.revision) + " is behind stored revision " +
                                 std::to_string(stored->revision) + " while a conflict is unresolved");
      }
      return KeepDivergent(tx, item, std::move(*stored), std::move(incoming));
    }

    if (stored->conflict_state != CONFLICT_STATE_NONE) {
      incoming.conflict_state   = stored->conflict_state;
      incoming.conflict_peer_id = stored->conflict_peer_id;
      incoming.canonical        = stored->canonical;
      incoming.displaced_holder = stored->displaced_holder;
    }
  }

  db::ThrowIfDbError(repository_->UpsertCheck(tx, incoming), "upsert check");
  return incoming.revision;
}

uint64_t RepositoryStore::KeepDivergent(db::Transaction& tx, const ReplayItem& item, db::model::CheckRecord stored,
                                        db::model::CheckRecord incoming) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto clone             = std::move(incoming);
  clone.id               = util::NewId();
  clone.conflict_state   = CONFLICT_STATE_CLONE;
  clone.conflict_peer_id = stored.id;
  clone.canonical        = false;
  clone.displaced_holder.clear();

  const auto stale_revision = clone.revision;
  stored.conflict_state     = CONFLICT_STATE_PENDING;
  stored.conflict_peer_id   = clone.id;
  stored.displaced_holder   = item.origin_id();
  stored.revision++;

  db::ThrowIfDbError(repository_->UpsertCheck(tx, stored), "flag check with divergent write");
  db::ThrowIfDbError(repository_->UpsertCheck(tx, clone), "insert divergent clone");

  google::protobuf::Struct details;
  (*details.mutable_fields())["clone_id"].set_string_value(clone.id);
  (*details.mutable_fields())["replay_id"].set_string_value(item.id());
  (*details.mutable_fields())["stale_revision"].set_number_value(static_cast<double>(stale_revision));

  db::model::AuditRecord audit;
  audit.id            = util::NewId();
  audit.action        = "replay_divergent_write";
  audit.target_type   = "check";
  audit.target_id     = stored.id;
  audit.actor_id      = item.origin_id();
  audit.details       = db::model::ToJson(details);
  audit.created_at_ms = now_ms;
  db::ThrowIfDbError(repository_->InsertAudit(tx, audit), "audit divergent write");

  RESYNC_LOG_WARN("Stale check write kept as conflict clone", {observability::StringField("check_id", stored.id),
                                                               observability::StringField("clone_id", clone.id),
                                                               observability::StringField("origin", item.origin_id()),
                                                               observability::IntField("stale_revision", static_cast<int64_t>(stale_revision)),
                                                               observability::IntField("stored_revision", static_cast<int64_t>(stored.revision))});
  return stored.revision;
}

void RepositoryStore::ApplyPayment(db::Transaction& tx, const ReplayItem& item) {
  if (item.operation() == REPLAY_OPERATION_DELETE) {
    db::ThrowIfDbError(repository_->DeletePayment(tx, item.entity_id()), "delete payment");
    return;
  }
  db::ThrowIfDbError(repository_->UpsertPayment(tx, db::model::PaymentFromProto(Decode<Payment>(item))), "upsert payment");
}

void RepositoryStore::ApplyTimeEntry(db::Transaction& tx, const ReplayItem& item) {
  if (item.operation() == REPLAY_OPERATION_DELETE) {
    db::ThrowIfDbError(repository_->DeleteTimeEntry(tx, item.entity_id()), "delete time entry");
    return;
  }
  db::ThrowIfDbError(repository_->UpsertTimeEntry(tx, db::model::TimeEntryFromProto(Decode<TimeEntry>(item))), "upsert time entry");
}

} // namespace resync::replay
