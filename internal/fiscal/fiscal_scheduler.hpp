#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace resync::fiscal {

inline constexpr const char* kAutoCloseNote = "Automatically closed at rollover time";

struct FiscalSchedulerOptions {
  // Upper bound on closes per property per pass.
  uint32_t max_iterations = 30;
};

/*
  Closes fiscal periods of auto-rollover properties once their business
  date has ended.

  Periods close strictly oldest first, one per transaction, so a backlog
  of several missed dates catches up in order and D+1 is never closed
  while D is still open. Each close aggregates the date's canonical checks
  and payments, clocks out employees left on the clock when the property
  asks for it, advances the property's current business date and opens
  the next period.
*/
class FiscalScheduler {
 public:
  FiscalScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, FiscalSchedulerOptions options = {});

  // One pass over every property; returns the number of periods closed.
  std::size_t RunOnce();

  // Returns the business dates closed for one property.
  std::vector<std::string> ProcessProperty(const std::string& property_id);

  db::model::FiscalTotals ComputeTotals(db::Transaction& tx, const std::string& property_id, const std::string& business_date);

 private:
  enum class StepResult { kIdle, kClosed, kSkipped };

  StepResult Step(const std::string& property_id, std::string* closed_date);

  void AutoClockOut(db::Transaction& tx, const db::model::PropertyRecord& property, const std::string& business_date, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  FiscalSchedulerOptions          options_;
};

} // namespace resync::fiscal
