#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "check_lock_table.hpp"
#include "holder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "lock_authority.hpp"

namespace resync::lock {

struct LockManagerOptions {
  std::chrono::milliseconds flush_timeout{5000};
};

/*
  Check lock authority.

  One active holder per check, any number of viewers. Overrides need a
  manager credential: a reachable holder is asked to flush and release
  (transfer), an unreachable one is left holding the original while the
  requester gets a non-canonical clone (clone), both flagged until a
  manager resolves the pair.

  reachability == nullptr treats every holder as reachable and
  channel == nullptr makes transfers report HOLDER_OFFLINE; a terminal's
  local-only manager runs that way.
*/
class CheckLockManager final : public LockAuthority {
 public:
  CheckLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<Authorizer> authorizer,
                   std::shared_ptr<HolderReachability> reachability = nullptr, std::shared_ptr<HolderChannel> channel = nullptr,
                   LockManagerOptions options = {});

  resync::v1::AcquireLockResponse   Acquire(const resync::v1::AcquireLockRequest& req) override;
  resync::v1::ReleaseLockResponse   Release(const resync::v1::ReleaseLockRequest& req) override;
  resync::v1::OverrideLockResponse  Override(const resync::v1::OverrideLockRequest& req) override;
  resync::v1::GetLockStatusResponse GetLockStatus(const resync::v1::GetLockStatusRequest& req) override;

  resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& req) override;
  resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& req) override;
  resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& req) override;

  // Drops every lock and view of a terminal; returns the affected checks.
  std::vector<std::string> ReleaseAll(const std::string& holder_id);

  // Conflicts the terminal must be told about when it comes back.
  std::vector<std::string> OnTerminalReconnected(const std::string& terminal_id);

  std::vector<CheckLock> ListLocks() const;

 private:
  using CheckPair = std::pair<db::model::CheckRecord, db::model::CheckRecord>;

  bool IsReachable(const std::string& holder_id, util::TimePoint now) const;
  void RequireManager(const resync::v1::ManagerCredential& credential, const std::string& action) const;

  std::optional<db::model::CheckRecord> LoadCheck(const std::string& check_id);
  std::optional<CheckPair>              LoadConflictPair(db::Transaction& tx, const db::model::CheckRecord& check);

  resync::v1::LockInfo BuildInfo(const std::string& check_id, const std::string& observer_id, bool conflict_pending,
                                 util::TimePoint now) const;

  resync::v1::OverrideLockResponse Transfer(const resync::v1::OverrideLockRequest& req, const std::string& holder_id,
                                            util::TimePoint now);
  resync::v1::OverrideLockResponse Clone(const resync::v1::OverrideLockRequest& req, const std::string& holder_id, util::TimePoint now);

  void Audit(db::Transaction& tx, const std::string& action, const std::string& target_id, const std::string& actor_id,
             const std::string& details, util::TimePoint now);

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<util::Clock>        clock_;
  std::shared_ptr<Authorizer>         authorizer_;
  std::shared_ptr<HolderReachability> reachability_;
  std::shared_ptr<HolderChannel>      channel_;
  LockManagerOptions                  options_;

  CheckLockTable table_;
};

} // namespace resync::lock
