#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "replay_queue.hpp"
#include "resync/v1/types.pb.h"

namespace resync::replay {

struct SavedCheck {
  std::string replay_id;
  uint64_t    revision = 0;
};

/*
  Terminal write path.

  Every mutation writes the local entity and appends its replay item in one
  transaction, so nothing reaches the local store without also being
  queued for the authoritative store.
*/
class LocalWriter {
 public:
  LocalWriter(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReplayQueue> queue, std::shared_ptr<util::Clock> clock);

  // A non-zero check.revision must match the stored revision
  // (util::LockConflict otherwise).
  SavedCheck SaveCheck(resync::v1::Check check);

  std::string RecordPayment(resync::v1::Payment payment);
  std::string RecordTimeEntry(resync::v1::TimeEntry entry);

 private:
  std::string BusinessDateFor(db::Transaction& tx, const std::string& property_id, util::TimePoint now);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<ReplayQueue>    queue_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace resync::replay
