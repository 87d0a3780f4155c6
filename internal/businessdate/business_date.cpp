#include "business_date.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <cctype>

#include "internal/util/errors.hpp"

namespace resync::businessdate {

namespace {

bool AllDigits(const std::string& value, size_t from, size_t count) {
  for (size_t i = from; i < from + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
  }
  return true;
}

int ToInt(const std::string& value, size_t from, size_t count) {
  int out = 0;
  for (size_t i = from; i < from + count; ++i) out = out * 10 + (value[i] - '0');
  return out;
}

bool TryParseDate(const std::string& value, absl::CivilDay* out) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;
  if (!AllDigits(value, 0, 4) || !AllDigits(value, 5, 2) || !AllDigits(value, 8, 2)) return false;

  const int year  = ToInt(value, 0, 4);
  const int month = ToInt(value, 5, 2);
  const int day   = ToInt(value, 8, 2);

  // CivilDay normalizes out-of-range fields, so a round trip rejects 2026-02-30
  const absl::CivilDay civil(year, month, day);
  if (civil.year() != year || civil.month() != month || civil.day() != day) return false;

  *out = civil;
  return true;
}

absl::CivilDay ParseDate(const std::string& value) {
  absl::CivilDay day;
  if (!TryParseDate(value, &day)) {
    throw util::InvalidArgument("invalid business date: '" + value + "'");
  }
  return day;
}

std::string FormatDate(absl::CivilDay day) {
  return absl::FormatCivilTime(day);
}

absl::TimeZone LoadZone(const std::string& name) {
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(name.empty() ? kDefaultTimezone : name, &tz)) {
    throw util::ConfigError("unknown timezone: '" + name + "'");
  }
  return tz;
}

RolloverTime RolloverOf(const db::model::PropertyRecord& property) {
  return ParseRolloverTime(property.rollover_time.empty() ? kDefaultRolloverTime : property.rollover_time);
}

// Skipped local times (DST gap) map to the transition instant; repeated
// local times take the earlier occurrence.
absl::Time LocalToAbsolute(absl::CivilSecond local, const absl::TimeZone& tz) {
  const auto info = tz.At(local);
  switch (info.kind) {
    case absl::TimeZone::TimeInfo::SKIPPED:
      return info.trans;
    case absl::TimeZone::TimeInfo::REPEATED:
    case absl::TimeZone::TimeInfo::UNIQUE:
    default:
      return info.pre;
  }
}

} // namespace

RolloverTime ParseRolloverTime(const std::string& value) {
  if (value.size() != 5 || value[2] != ':' || !AllDigits(value, 0, 2) || !AllDigits(value, 3, 2)) {
    throw util::ConfigError("rollover time must be HH:MM, got '" + value + "'");
  }

  RolloverTime out;
  out.hour   = ToInt(value, 0, 2);
  out.minute = ToInt(value, 3, 2);
  if (out.hour > 23 || out.minute > 59) {
    throw util::ConfigError("rollover time out of range: '" + value + "'");
  }
  return out;
}

bool IsValidBusinessDate(const std::string& value) {
  absl::CivilDay day;
  return TryParseDate(value, &day);
}

std::string IncrementDate(const std::string& business_date) {
  return FormatDate(ParseDate(business_date) + 1);
}

std::string DecrementDate(const std::string& business_date) {
  return FormatDate(ParseDate(business_date) - 1);
}

std::string DeriveBusinessDate(util::TimePoint timestamp, const db::model::PropertyRecord& property) {
  const auto tz       = LoadZone(property.timezone);
  const auto rollover = RolloverOf(property);

  const absl::Time     instant = absl::FromChrono(timestamp);
  const absl::CivilDay day(absl::ToCivilSecond(instant, tz));

  // Compared as instants so the repeated hour of a DST fall-back cannot
  // move the date backwards.
  const absl::Time rollover_today =
      LocalToAbsolute(absl::CivilSecond(day.year(), day.month(), day.day(), rollover.hour, rollover.minute, 0), tz);

  if (rollover.hour < 12) {
    return FormatDate(instant < rollover_today ? day - 1 : day);
  }
  return FormatDate(instant >= rollover_today ? day + 1 : day);
}

std::string ResolveBusinessDate(util::TimePoint timestamp, const db::model::PropertyRecord& property) {
  if (IsValidBusinessDate(property.current_business_date)) {
    return property.current_business_date;
  }
  return DeriveBusinessDate(timestamp, property);
}

util::TimePoint GetBusinessDateClosingInstant(const std::string& business_date, const db::model::PropertyRecord& property) {
  const auto tz       = LoadZone(property.timezone);
  const auto rollover = RolloverOf(property);
  const auto day      = ParseDate(business_date);

  const absl::CivilDay    closing_day = rollover.hour < 12 ? day + 1 : day;
  const absl::CivilSecond closing_local(closing_day.year(), closing_day.month(), closing_day.day(), rollover.hour, rollover.minute, 0);

  return absl::ToChronoTime(LocalToAbsolute(closing_local, tz));
}

bool HasReachedClosingTime(const std::string& business_date, const db::model::PropertyRecord& property, util::TimePoint now) {
  return now >= GetBusinessDateClosingInstant(business_date, property);
}

BusinessDateRange GetBusinessDateRange(const std::string& business_date, const db::model::PropertyRecord& property) {
  BusinessDateRange range;
  range.start = GetBusinessDateClosingInstant(DecrementDate(business_date), property);
  range.end   = GetBusinessDateClosingInstant(business_date, property);
  return range;
}

bool HasBusinessDateChanged(const std::string& last_business_date, const db::model::PropertyRecord& property, util::TimePoint now) {
  return ResolveBusinessDate(now, property) != last_business_date;
}

void ApplyPropertyDefaults(db::model::PropertyRecord& property) {
  if (property.timezone.empty()) property.timezone = kDefaultTimezone;
  if (property.rollover_time.empty()) property.rollover_time = kDefaultRolloverTime;
  if (property.rollover_mode == resync::v1::ROLLOVER_MODE_UNSPECIFIED) property.rollover_mode = resync::v1::ROLLOVER_MODE_AUTO;
}

void ValidateProperty(const db::model::PropertyRecord& property) {
  const std::string where = "property '" + property.id + "': ";

  if (property.id.empty()) {
    throw util::ConfigError("property id is required");
  }

  absl::TimeZone tz;
  if (!absl::LoadTimeZone(property.timezone, &tz)) {
    throw util::ConfigError(where + "unknown timezone '" + property.timezone + "'");
  }

  RolloverTime rollover;
  try {
    rollover = ParseRolloverTime(property.rollover_time);
  } catch (const util::ConfigError& e) {
    throw util::ConfigError(where + e.what());
  }

  if (rollover.hour >= 12 && !property.allow_pm_rollover) {
    throw util::ConfigError(where + "rollover time " + property.rollover_time + " is in the afternoon; set allow_pm_rollover to accept it");
  }

  if (!property.current_business_date.empty() && !IsValidBusinessDate(property.current_business_date)) {
    throw util::ConfigError(where + "invalid current_business_date '" + property.current_business_date + "'");
  }
}

} // namespace resync::businessdate
