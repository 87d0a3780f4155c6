#pragma once

#include <chrono>
#include <string>

#include "internal/util/time.hpp"

namespace resync::lock {

// Answers whether a lock holder terminal is currently reachable.
class HolderReachability {
 public:
  virtual ~HolderReachability() = default;

  virtual bool IsReachable(const std::string& terminal_id, util::TimePoint now) const = 0;
};

/*
  Flush-and-release handshake with the terminal holding a lock.

  The holder drains its pending replay items for the check and releases
  the lock. Returns true only when the holder acknowledged within timeout.
*/
class HolderChannel {
 public:
  virtual ~HolderChannel() = default;

  virtual bool RequestFlushAndRelease(const std::string& terminal_id, const std::string& check_id,
                                      std::chrono::milliseconds timeout) = 0;
};

struct Credential {
  std::string employee_id;
  std::string pin;
};

// Elevated (manager) authentication.
class Authorizer {
 public:
  virtual ~Authorizer() = default;

  virtual bool IsManager(const Credential& credential) const = 0;
};

} // namespace resync::lock
