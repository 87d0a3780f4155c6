#pragma once

#include <memory>

#include "authoritative_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace resync::replay {

/*
  Authority-side AuthoritativeStore over the node's repository.

  Check writes never clear conflict tracking set by the lock manager.

  A check write older than the stored revision carries history the
  authority has not seen. It is kept as a conflict clone of the stored
  check, displacing the item's origin terminal, unless the check is
  already in conflict; then Apply throws LockConflict and the item stays
  queued until the conflict is resolved.
*/
class RepositoryStore final : public AuthoritativeStore {
 public:
  explicit RepositoryStore(std::shared_ptr<db::Repository> repository,
                           std::shared_ptr<util::Clock> clock = std::make_shared<util::WallClock>());

  uint64_t Apply(const resync::v1::ReplayItem& item, std::chrono::milliseconds timeout) override;

 private:
  uint64_t ApplyCheck(db::Transaction& tx, const resync::v1::ReplayItem& item);
  uint64_t KeepDivergent(db::Transaction& tx, const resync::v1::ReplayItem& item, db::model::CheckRecord stored,
                         db::model::CheckRecord incoming);
  void     ApplyPayment(db::Transaction& tx, const resync::v1::ReplayItem& item);
  void     ApplyTimeEntry(db::Transaction& tx, const resync::v1::ReplayItem& item);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace resync::replay
