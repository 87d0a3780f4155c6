#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace resync::lock {

/*
  In-memory lock state of one check on the authority.

  holder_id empty means no active holder. revision bumps on every holder
  transition and is part of the compare-and-swap key.
*/
struct CheckLock {
  std::string           check_id;
  std::string           holder_id;
  util::TimePoint       acquired_at{};
  uint64_t              revision = 0;
  std::set<std::string> viewers;
};

} // namespace resync::lock
