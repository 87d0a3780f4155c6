#pragma once

#include <chrono>
#include <cstdint>

#include "resync/v1/types.pb.h"

namespace resync::replay {

/*
  Store a replay item is applied to: the relay host or the cloud.

  Apply is an idempotent upsert (or delete) keyed by entity id; applying
  the same item twice leaves the same state as applying it once. Failures
  are thrown. Returns the stored revision for checks, 0 otherwise.
*/
class AuthoritativeStore {
 public:
  virtual ~AuthoritativeStore() = default;

  virtual uint64_t Apply(const resync::v1::ReplayItem& item, std::chrono::milliseconds timeout) = 0;
};

} // namespace resync::replay
