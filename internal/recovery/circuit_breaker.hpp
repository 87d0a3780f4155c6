#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "internal/util/time.hpp"
#include "resync/v1/types.pb.h"

namespace resync::recovery {

struct CircuitBreakerOptions {
  uint32_t                  failure_threshold = 3;
  std::chrono::milliseconds recovery_time{30000};
  uint32_t                  half_open_max_attempts = 2;
};

/*
  Per-service circuit breaker.

    closed    -> open       after failure_threshold consecutive failures
    open      -> half_open  once recovery_time has passed
    half_open -> closed     after half_open_max_attempts successes
    half_open -> open       on any failure
*/
class CircuitBreaker {
 public:
  CircuitBreaker(std::string name, std::shared_ptr<util::Clock> clock, CircuitBreakerOptions options = {});

  // Throws util::CircuitOpen without calling fn while the circuit is open;
  // otherwise runs fn, records the outcome and rethrows its exception.
  void Execute(const std::function<void()>& fn);

  bool AllowRequest();
  void RecordSuccess();
  void RecordFailure();
  void Reset();

  resync::v1::CircuitState State() const;
  uint32_t                 Failures() const;

 private:
  std::string                  name_;
  std::shared_ptr<util::Clock> clock_;
  CircuitBreakerOptions        options_;

  mutable std::mutex       mutex_;
  resync::v1::CircuitState state_     = resync::v1::CIRCUIT_STATE_CLOSED;
  uint32_t                 failures_  = 0;
  uint32_t                 successes_ = 0;
  util::TimePoint          opened_at_{};
};

} // namespace resync::recovery
