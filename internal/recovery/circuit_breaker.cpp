#include "circuit_breaker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resync::recovery {

using namespace resync::v1;

CircuitBreaker::CircuitBreaker(std::string name, std::shared_ptr<util::Clock> clock, CircuitBreakerOptions options)
    : name_(std::move(name)), clock_(std::move(clock)), options_(options) {
  if (!clock_) throw std::invalid_argument("CircuitBreaker requires a clock");
  if (options_.failure_threshold == 0) options_.failure_threshold = 1;
  if (options_.half_open_max_attempts == 0) options_.half_open_max_attempts = 1;
}

void CircuitBreaker::Execute(const std::function<void()>& fn) {
  if (!AllowRequest()) {
    throw util::CircuitOpen("circuit for " + name_ + " is open");
  }

  try {
    fn();
  } catch (...) {
    RecordFailure();
    throw;
  }
  RecordSuccess();
}

bool CircuitBreaker::AllowRequest() {
  std::lock_guard lock(mutex_);

  if (state_ != CIRCUIT_STATE_OPEN) return true;
  if (clock_->Now() - opened_at_ < options_.recovery_time) return false;

  state_     = CIRCUIT_STATE_HALF_OPEN;
  successes_ = 0;
  RESYNC_LOG_INFO("Circuit half-open", {observability::StringField("service", name_)});
  return true;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard lock(mutex_);

  if (state_ == CIRCUIT_STATE_HALF_OPEN) {
    if (++successes_ >= options_.half_open_max_attempts) {
      state_    = CIRCUIT_STATE_CLOSED;
      failures_ = 0;
      RESYNC_LOG_INFO("Circuit closed", {observability::StringField("service", name_)});
    }
    return;
  }
  failures_ = 0;
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard lock(mutex_);

  ++failures_;
  if (state_ == CIRCUIT_STATE_HALF_OPEN || (state_ == CIRCUIT_STATE_CLOSED && failures_ >= options_.failure_threshold)) {
    state_     = CIRCUIT_STATE_OPEN;
    opened_at_ = clock_->Now();
    RESYNC_LOG_WARN("Circuit opened", {observability::StringField("service", name_), observability::IntField("failures", failures_)});
  }
}

void CircuitBreaker::Reset() {
  std::lock_guard lock(mutex_);
  state_     = CIRCUIT_STATE_CLOSED;
  failures_  = 0;
  successes_ = 0;
}

CircuitState CircuitBreaker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint32_t CircuitBreaker::Failures() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

} // namespace resync::recovery
