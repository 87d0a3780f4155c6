#pragma once

#include <string>

#include "internal/db/model/property_record.hpp"
#include "internal/util/time.hpp"

namespace resync::businessdate {

/*
  Business-date engine.

  A business date is the operational day a transaction belongs to. It
  ends at the property's local rollover time:

    AM rollover (hour < 12): local time before the rollover belongs to
      the previous calendar day.
    PM rollover (hour >= 12): local time at or after the rollover belongs
      to the next calendar day.

  All functions are pure given the property record. Dates are YYYY-MM-DD.
*/

inline constexpr const char* kDefaultTimezone     = "America/New_York";
inline constexpr const char* kDefaultRolloverTime = "04:00";

struct RolloverTime {
  int hour   = 0;
  int minute = 0;
};

struct BusinessDateRange {
  util::TimePoint start; // inclusive
  util::TimePoint end;   // exclusive
};

// Strict HH:MM, HH 00-23 and MM 00-59. Throws util::ConfigError.
RolloverTime ParseRolloverTime(const std::string& value);

// Strict YYYY-MM-DD naming a real calendar day.
bool IsValidBusinessDate(const std::string& value);

// Throw util::InvalidArgument on an invalid date.
std::string IncrementDate(const std::string& business_date);
std::string DecrementDate(const std::string& business_date);

// Honors a valid current_business_date override.
std::string ResolveBusinessDate(util::TimePoint timestamp, const db::model::PropertyRecord& property);

// Clock-derived date; ignores the override.
std::string DeriveBusinessDate(util::TimePoint timestamp, const db::model::PropertyRecord& property);

util::TimePoint GetBusinessDateClosingInstant(const std::string& business_date, const db::model::PropertyRecord& property);

bool HasReachedClosingTime(const std::string& business_date, const db::model::PropertyRecord& property, util::TimePoint now);

BusinessDateRange GetBusinessDateRange(const std::string& business_date, const db::model::PropertyRecord& property);

bool HasBusinessDateChanged(const std::string& last_business_date, const db::model::PropertyRecord& property, util::TimePoint now);

// Fills empty timezone / rollover / mode with the defaults.
void ApplyPropertyDefaults(db::model::PropertyRecord& property);

// Throws util::ConfigError describing the first invalid field.
void ValidateProperty(const db::model::PropertyRecord& property);

} // namespace resync::businessdate
