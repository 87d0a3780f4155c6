#include "check_lock_manager.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <stdexcept>

#include "conflict_merge.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resync::lock {

using namespace resync::v1;

namespace {

void RequireIds(const std::string& check_id, const std::string& terminal_id) {
  if (check_id.empty()) throw util::InvalidArgument("check_id is required");
  if (terminal_id.empty()) throw util::InvalidArgument("terminal id is required");
}

bool InConflict(const db::model::CheckRecord& check) {
  return check.conflict_state == CONFLICT_STATE_PENDING || check.conflict_state == CONFLICT_STATE_CLONE;
}

std::string ResolutionName(Resolution resolution) {
  switch (resolution) {
    case RESOLUTION_KEEP_A:
      return "keep_a";
    case RESOLUTION_KEEP_B:
      return "keep_b";
    case RESOLUTION_MERGE:
      return "merge";
    default:
      return "unspecified";
  }
}

std::string DetailsJson(std::initializer_list<std::pair<std::string, std::string>> fields,
                        const std::vector<std::string>& diverged = {}) {
  google::protobuf::Struct details;
  for (const auto& [key, value] : fields) {
    (*details.mutable_fields())[key].set_string_value(value);
  }
  if (!diverged.empty()) {
    auto* list = (*details.mutable_fields())["diverged_line_items"].mutable_list_value();
    for (const auto& id : diverged) list->add_values()->set_string_value(id);
  }
  return db::model::ToJson(details);
}

} // namespace

CheckLockManager::CheckLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                   std::shared_ptr<Authorizer> authorizer, std::shared_ptr<HolderReachability> reachability,
                                   std::shared_ptr<HolderChannel> channel, LockManagerOptions options)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      authorizer_(std::move(authorizer)),
      reachability_(std::move(reachability)),
      channel_(std::move(channel)),
      options_(options) {
  if (!repository_ || !clock_ || !authorizer_) {
    throw std::invalid_argument("CheckLockManager requires repository, clock and authorizer");
  }
}

bool CheckLockManager::IsReachable(const std::string& holder_id, util::TimePoint now) const {
  return !reachability_ || reachability_->IsReachable(holder_id, now);
}

void CheckLockManager::RequireManager(const ManagerCredential& credential, const std::string& action) const {
  if (!authorizer_->IsManager(Credential{credential.employee_id(), credential.pin()})) {
    throw util::Unauthorized(action + " requires a manager credential");
  }
}

std::optional<db::model::CheckRecord> CheckLockManager::LoadCheck(const std::string& check_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCheck(*tx, check_id);
  tx->Commit();
  return record;
}

std::optional<CheckLockManager::CheckPair> CheckLockManager::LoadConflictPair(db::Transaction& tx, const db::model::CheckRecord& check) {
  if (!InConflict(check) || check.conflict_peer_id.empty()) return std::nullopt;

  auto peer = repository_->GetCheck(tx, check.conflict_peer_id);
  if (!peer) return std::nullopt;

  if (check.conflict_state == CONFLICT_STATE_PENDING && peer->conflict_state == CONFLICT_STATE_CLONE) {
    return CheckPair{check, *peer};
  }
  if (check.conflict_state == CONFLICT_STATE_CLONE && peer->conflict_state == CONFLICT_STATE_PENDING) {
    return CheckPair{*peer, check};
  }
  return std::nullopt;
}

LockInfo CheckLockManager::BuildInfo(const std::string& check_id, const std::string& observer_id, bool conflict_pending,
                                     util::TimePoint now) const {
  LockInfo info;
  info.set_check_id(check_id);
  info.set_conflict_pending(conflict_pending);
  info.set_indicator(LOCK_INDICATOR_GREEN);

  const auto lock = table_.Get(check_id);
  if (!lock) return info;

  for (const auto& viewer : lock->viewers) info.add_viewers(viewer);

  if (lock->holder_id.empty()) {
    info.set_lock_type(lock->viewers.empty() ? LOCK_TYPE_UNSPECIFIED : LOCK_TYPE_VIEW);
    return info;
  }

  info.set_locked(true);
  info.set_holder_id(lock->holder_id);
  info.set_lock_type(LOCK_TYPE_ACTIVE);
  info.set_acquired_at_ms(util::ToUnixMillis(lock->acquired_at));

  if (lock->holder_id != observer_id) {
    info.set_indicator(IsReachable(lock->holder_id, now) ? LOCK_INDICATOR_YELLOW : LOCK_INDICATOR_RED);
  }
  return info;
}

void CheckLockManager::Audit(db::Transaction& tx, const std::string& action, const std::string& target_id, const std::string& actor_id,
                             const std::string& details, util::TimePoint now) {
  db::model::AuditRecord record;
  record.id            = util::NewId();
  record.action        = action;
  record.target_type   = "check";
  record.target_id     = target_id;
  record.actor_id      = actor_id;
  record.details       = details;
  record.created_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->InsertAudit(tx, record), "audit " + action);
}

AcquireLockResponse CheckLockManager::Acquire(const AcquireLockRequest& req) {
  RequireIds(req.check_id(), req.requester_id());

  const auto now    = clock_->Now();
  const auto record = LoadCheck(req.check_id());
  if (record && record->conflict_state == CONFLICT_STATE_RESOLVED) {
    throw util::InvalidState("check " + req.check_id() + " was retired by conflict resolution");
  }
  const bool conflict_pending = record && InConflict(*record);

  AcquireLockResponse resp;

  if (req.lock_type() == LOCK_TYPE_VIEW) {
    table_.AddViewer(req.check_id(), req.requester_id());
    resp.set_outcome(ACQUIRE_OUTCOME_GRANTED);
    *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), conflict_pending, now);
    return resp;
  }

  while (true) {
    if (table_.CompareAndSwap(req.check_id(), "", req.requester_id(), now)) {
      resp.set_outcome(ACQUIRE_OUTCOME_GRANTED);
      RESYNC_LOG_DEBUG("Check lock granted",
                       {observability::StringField("check_id", req.check_id()), observability::StringField("holder", req.requester_id())});
      break;
    }

    const auto current = table_.Get(req.check_id());
    if (!current || current->holder_id.empty()) {
      // released between the swap and the read
      continue;
    }

    if (current->holder_id == req.requester_id()) {
      resp.set_outcome(ACQUIRE_OUTCOME_ALREADY_HELD);
    } else {
      resp.set_outcome(IsReachable(current->holder_id, now) ? ACQUIRE_OUTCOME_IN_USE : ACQUIRE_OUTCOME_HOLDER_OFFLINE);
    }
    break;
  }

  observability::Metrics::Instance().RecordLockAcquire(AcquireOutcome_Name(resp.outcome()));
  *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), conflict_pending, now);
  return resp;
}

ReleaseLockResponse CheckLockManager::Release(const ReleaseLockRequest& req) {
  RequireIds(req.check_id(), req.holder_id());

  bool released = table_.CompareAndSwap(req.check_id(), req.holder_id(), "", clock_->Now());
  released      = table_.RemoveViewer(req.check_id(), req.holder_id()) || released;

  ReleaseLockResponse resp;
  resp.set_released(released);
  return resp;
}

GetLockStatusResponse CheckLockManager::GetLockStatus(const GetLockStatusRequest& req) {
  if (req.check_id().empty()) throw util::InvalidArgument("check_id is required");

  const auto record = LoadCheck(req.check_id());

  GetLockStatusResponse resp;
  *resp.mutable_lock() = BuildInfo(req.check_id(), req.observer_id(), record && InConflict(*record), clock_->Now());
  return resp;
}

OverrideLockResponse CheckLockManager::Override(const OverrideLockRequest& req) {
  RequireIds(req.check_id(), req.requester_id());
  RequireManager(req.credential(), "lock override");

  const auto now     = clock_->Now();
  const auto current = table_.Get(req.check_id());

  OverrideLockResponse resp;
  if (!current || current->holder_id.empty()) {
    resp.set_outcome(OVERRIDE_OUTCOME_NOT_LOCKED);
    *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), false, now);
    return resp;
  }

  const auto holder = current->holder_id;
  if (holder == req.requester_id()) {
    resp.set_outcome(OVERRIDE_OUTCOME_TRANSFERRED);
    resp.set_locked_check_id(req.check_id());
    *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), false, now);
    return resp;
  }

  const bool holder_reachable = IsReachable(holder, now);
  if (!holder_reachable && !req.acknowledge_risk()) {
    throw util::InvalidState("holder " + holder + " is unreachable; override requires acknowledge_risk");
  }

  resp = holder_reachable ? Transfer(req, holder, now) : Clone(req, holder, now);
  observability::Metrics::Instance().RecordLockOverride(OverrideOutcome_Name(resp.outcome()));
  return resp;
}

OverrideLockResponse CheckLockManager::Transfer(const OverrideLockRequest& req, const std::string& holder_id, util::TimePoint now) {
  OverrideLockResponse resp;

  const bool acknowledged = channel_ && channel_->RequestFlushAndRelease(holder_id, req.check_id(), options_.flush_timeout);
  if (!acknowledged) {
    RESYNC_LOG_WARN("Lock holder did not acknowledge flush and release",
                    {observability::StringField("check_id", req.check_id()), observability::StringField("holder", holder_id)});
    resp.set_outcome(OVERRIDE_OUTCOME_HOLDER_OFFLINE);
    *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), false, now);
    return resp;
  }

  // The holder normally released during the flush; take the lock either way.
  if (!table_.CompareAndSwap(req.check_id(), "", req.requester_id(), now) &&
      !table_.CompareAndSwap(req.check_id(), holder_id, req.requester_id(), now)) {
    throw util::LockConflict("lock on check " + req.check_id() + " changed during override");
  }

  auto tx = repository_->Begin();
  Audit(*tx, "lock_override_transfer", req.check_id(), req.requester_id(),
        DetailsJson({{"previous_holder", holder_id}, {"manager_id", req.credential().employee_id()}}), now);
  tx->Commit();

  RESYNC_LOG_INFO("Check lock transferred", {observability::StringField("check_id", req.check_id()),
                                             observability::StringField("from", holder_id),
                                             observability::StringField("to", req.requester_id())});

  resp.set_outcome(OVERRIDE_OUTCOME_TRANSFERRED);
  resp.set_locked_check_id(req.check_id());
  *resp.mutable_lock() = BuildInfo(req.check_id(), req.requester_id(), false, now);
  return resp;
}

OverrideLockResponse CheckLockManager::Clone(const OverrideLockRequest& req, const std::string& holder_id, util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  auto tx       = repository_->Begin();
  auto original = repository_->GetCheck(*tx, req.check_id());
  if (!original) throw util::NotFound("check " + req.check_id() + " not found");
  if (original->conflict_state != CONFLICT_STATE_NONE) {
    throw util::InvalidState("check " + req.check_id() + " is already part of a conflict");
  }

  auto clone             = *original;
  clone.id               = util::NewId();
  clone.conflict_state   = CONFLICT_STATE_CLONE;
  clone.conflict_peer_id = original->id;
  clone.canonical        = false;
  clone.displaced_holder.clear();

  original->conflict_state   = CONFLICT_STATE_PENDING;
  original->conflict_peer_id = clone.id;
  original->displaced_holder = holder_id;
  original->revision++;

  db::ThrowIfDbError(repository_->UpsertCheck(*tx, *original), "flag original check");
  db::ThrowIfDbError(repository_->UpsertCheck(*tx, clone), "insert clone check");
  Audit(*tx, "lock_override_clone", original->id, req.requester_id(),
        DetailsJson({{"clone_id", clone.id},
                     {"displaced_holder", holder_id},
                     {"manager_id", req.credential().employee_id()},
                     {"created_at_ms", std::to_string(now_ms)}}),
        now);
  tx->Commit();

  if (!table_.CompareAndSwap(clone.id, "", req.requester_id(), now)) {
    throw util::LockConflict("clone " + clone.id + " was locked before the override completed");
  }

  RESYNC_LOG_WARN("Check cloned away from unreachable holder", {observability::StringField("check_id", original->id),
                                                                observability::StringField("clone_id", clone.id),
                                                                observability::StringField("displaced_holder", holder_id)});

  OverrideLockResponse resp;
  resp.set_outcome(OVERRIDE_OUTCOME_CLONED);
  resp.set_locked_check_id(clone.id);
  *resp.mutable_lock() = BuildInfo(clone.id, req.requester_id(), true, now);
  return resp;
}

GetConflictResponse CheckLockManager::GetConflict(const GetConflictRequest& req) {
  if (req.check_id().empty()) throw util::InvalidArgument("check_id is required");

  auto tx    = repository_->Begin();
  auto check = repository_->GetCheck(*tx, req.check_id());
  if (!check) throw util::NotFound("check " + req.check_id() + " not found");
  const auto pair = LoadConflictPair(*tx, *check);
  tx->Commit();

  GetConflictResponse resp;
  if (!pair) {
    *resp.mutable_original() = db::model::ToProto(*check);
    return resp;
  }

  resp.set_pending(true);
  *resp.mutable_original() = db::model::ToProto(pair->first);
  *resp.mutable_clone()    = db::model::ToProto(pair->second);
  return resp;
}

ResolveConflictResponse CheckLockManager::ResolveConflict(const ResolveConflictRequest& req) {
  if (req.check_id().empty()) throw util::InvalidArgument("check_id is required");
  if (req.resolution() == RESOLUTION_UNSPECIFIED) throw util::InvalidArgument("resolution is required");
  RequireManager(req.credential(), "conflict resolution");

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx    = repository_->Begin();
  auto check = repository_->GetCheck(*tx, req.check_id());
  if (!check) throw util::NotFound("check " + req.check_id() + " not found");

  auto pair = LoadConflictPair(*tx, *check);
  if (!pair) throw util::InvalidState("check " + req.check_id() + " has no pending conflict");

  auto& [original, clone] = *pair;
  if (!original.displaced_holder.empty() && !IsReachable(original.displaced_holder, now) && !req.acknowledge_risk()) {
    throw util::InvalidState("displaced terminal " + original.displaced_holder +
                             " has not reconnected; resolution requires acknowledge_risk");
  }

  db::model::CheckRecord   canonical;
  std::vector<std::string> diverged;
  switch (req.resolution()) {
    case RESOLUTION_KEEP_A:
      canonical = original;
      break;
    case RESOLUTION_KEEP_B:
      canonical = clone;
      break;
    case RESOLUTION_MERGE: {
      canonical   = clone.updated_at_ms > original.updated_at_ms ? clone : original;
      auto merged = MergeLineItems(original.line_items, clone.line_items);
      canonical.line_items = std::move(merged.line_items);
      diverged             = std::move(merged.diverged);
      break;
    }
    default:
      throw util::InvalidArgument("unknown resolution");
  }

  canonical.id             = original.id;
  canonical.property_id    = original.property_id;
  canonical.business_date  = original.business_date;
  canonical.conflict_state = CONFLICT_STATE_NONE;
  canonical.conflict_peer_id.clear();
  canonical.canonical = true;
  canonical.displaced_holder.clear();
  canonical.revision      = std::max(original.revision, clone.revision) + 1;
  canonical.updated_at_ms = now_ms;

  clone.conflict_state = CONFLICT_STATE_RESOLVED;
  clone.canonical      = false;
  clone.revision++;
  clone.updated_at_ms = now_ms;

  db::ThrowIfDbError(repository_->UpsertCheck(*tx, canonical), "write canonical check");
  db::ThrowIfDbError(repository_->UpsertCheck(*tx, clone), "retire clone check");
  Audit(*tx, "conflict_resolved", original.id, req.resolver_id(),
        DetailsJson({{"resolution", ResolutionName(req.resolution())},
                     {"clone_id", clone.id},
                     {"manager_id", req.credential().employee_id()}},
                    diverged),
        now);
  tx->Commit();

  table_.Clear(original.id);
  table_.Clear(clone.id);

  RESYNC_LOG_INFO("Check conflict resolved", {observability::StringField("check_id", original.id),
                                              observability::StringField("clone_id", clone.id),
                                              observability::StringField("resolution", ResolutionName(req.resolution())),
                                              observability::IntField("diverged", static_cast<int64_t>(diverged.size()))});

  ResolveConflictResponse resp;
  *resp.mutable_canonical() = db::model::ToProto(canonical);
  for (const auto& id : diverged) resp.add_diverged_line_items(id);
  return resp;
}

ListConflictsResponse CheckLockManager::ListConflicts(const ListConflictsRequest& req) {
  if (req.terminal_id().empty()) throw util::InvalidArgument("terminal_id is required");

  auto tx      = repository_->Begin();
  auto checks  = repository_->ListConflictedChecks(*tx, req.terminal_id());
  tx->Commit();

  ListConflictsResponse resp;
  for (const auto& check : checks) resp.add_check_ids(check.id);
  return resp;
}

std::vector<std::string> CheckLockManager::ReleaseAll(const std::string& holder_id) {
  return table_.ReleaseAll(holder_id);
}

std::vector<std::string> CheckLockManager::OnTerminalReconnected(const std::string& terminal_id) {
  ListConflictsRequest req;
  req.set_terminal_id(terminal_id);
  const auto resp = ListConflicts(req);

  std::vector<std::string> ids(resp.check_ids().begin(), resp.check_ids().end());
  if (!ids.empty()) {
    RESYNC_LOG_WARN("Reconnected terminal has checks pending conflict resolution",
                    {observability::StringField("terminal_id", terminal_id), observability::IntField("checks", static_cast<int64_t>(ids.size()))});
  }
  return ids;
}

std::vector<CheckLock> CheckLockManager::ListLocks() const {
  return table_.List();
}

} // namespace resync::lock
