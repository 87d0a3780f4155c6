#include "internal/businessdate/business_date.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using resync::businessdate::DeriveBusinessDate;
using resync::businessdate::GetBusinessDateClosingInstant;
using resync::businessdate::GetBusinessDateRange;
using resync::businessdate::ResolveBusinessDate;
using resync::db::model::PropertyRecord;

PropertyRecord MakeProperty(const std::string& rollover_time, bool allow_pm = false) {
  PropertyRecord property;
  property.id                = "downtown";
  property.timezone          = "America/New_York";
  property.rollover_time     = rollover_time;
  property.allow_pm_rollover = allow_pm;
  return property;
}

resync::util::TimePoint Local(int y, int mo, int d, int h, int mi, const std::string& zone = "America/New_York") {
  absl::TimeZone tz;
  const bool     loaded = absl::LoadTimeZone(zone, &tz);
  assert(loaded);
  return absl::ToChronoTime(absl::FromCivil(absl::CivilSecond(y, mo, d, h, mi, 0), tz));
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestAmRolloverAssignsEarlyHoursToPreviousDay() {
  const auto property = MakeProperty("04:00");

  assert(DeriveBusinessDate(Local(2026, 1, 5, 2, 30), property) == "2026-01-04");
  assert(DeriveBusinessDate(Local(2026, 1, 5, 3, 59), property) == "2026-01-04");
  assert(DeriveBusinessDate(Local(2026, 1, 5, 4, 0), property) == "2026-01-05");
  assert(DeriveBusinessDate(Local(2026, 1, 5, 10, 0), property) == "2026-01-05");
}

void TestPmRolloverAssignsLateHoursToNextDay() {
  const auto property = MakeProperty("22:00", true);

  assert(DeriveBusinessDate(Local(2026, 1, 5, 21, 59), property) == "2026-01-05");
  assert(DeriveBusinessDate(Local(2026, 1, 5, 23, 0), property) == "2026-01-06");
}

void TestOverrideWinsOnlyWhenValid() {
  auto property                  = MakeProperty("04:00");
  property.current_business_date = "2026-01-01";
  assert(ResolveBusinessDate(Local(2026, 1, 5, 10, 0), property) == "2026-01-01");
  assert(DeriveBusinessDate(Local(2026, 1, 5, 10, 0), property) == "2026-01-05");

  property.current_business_date = "2026-02-30";
  assert(ResolveBusinessDate(Local(2026, 1, 5, 10, 0), property) == "2026-01-05");
}

void TestClosingInstantAndRange() {
  const auto am = MakeProperty("04:00");
  assert(GetBusinessDateClosingInstant("2026-01-04", am) == Local(2026, 1, 5, 4, 0));

  const auto pm = MakeProperty("22:00", true);
  assert(GetBusinessDateClosingInstant("2026-01-06", pm) == Local(2026, 1, 6, 22, 0));

  const auto range = GetBusinessDateRange("2026-01-05", am);
  assert(range.start == Local(2026, 1, 5, 4, 0));
  assert(range.end == Local(2026, 1, 6, 4, 0));
}

void TestDstGapClosesAtTransition() {
  // 2026-03-08 02:00 local does not exist in New York.
  const auto property = MakeProperty("02:30");
  const auto closing  = GetBusinessDateClosingInstant("2026-03-07", property);
  assert(closing == Local(2026, 3, 8, 3, 0));

  const auto range = GetBusinessDateRange("2026-03-08", property);
  assert(range.end - range.start == std::chrono::hours(23) + std::chrono::minutes(30));
}

void TestRepeatedHourDoesNotGoBack() {
  // 2026-11-01 01:00-02:00 happens twice in New York.
  const auto property = MakeProperty("01:30");
  const auto first    = Local(2026, 11, 1, 1, 10);
  assert(DeriveBusinessDate(first, property) == "2026-10-31");
  assert(DeriveBusinessDate(first + std::chrono::hours(1), property) == "2026-11-01");
}

void TestResolveIsMonotonic() {
  using namespace std::chrono_literals;
  using resync::businessdate::IncrementDate;

  const std::vector<PropertyRecord> properties{MakeProperty("04:00"), MakeProperty("02:30"), MakeProperty("01:30"),
                                               MakeProperty("22:00", true), MakeProperty("23:45", true)};
  const std::vector<resync::util::TimePoint> windows{Local(2026, 3, 6, 0, 0), Local(2026, 10, 30, 0, 0), Local(2026, 12, 30, 0, 0)};

  for (const auto& property : properties) {
    for (const auto start : windows) {
      for (auto t = start; t < start + 96h; t += 15min) {
        const auto date = ResolveBusinessDate(t, property);
        assert(date <= ResolveBusinessDate(t + 24h, property));

        const auto next = ResolveBusinessDate(t + 15min, property);
        assert(next == date || next == IncrementDate(date));

        const auto range = GetBusinessDateRange(date, property);
        assert(range.start <= t && t < range.end);
      }
    }
  }
}

void TestDateArithmeticCrossesMonthAndLeapDay() {
  assert(resync::businessdate::IncrementDate("2028-02-28") == "2028-02-29");
  assert(resync::businessdate::IncrementDate("2026-12-31") == "2027-01-01");
  assert(resync::businessdate::DecrementDate("2026-03-01") == "2026-02-28");
  assert(Throws<resync::util::InvalidArgument>([] { resync::businessdate::IncrementDate("2026-13-01"); }));
}

void TestValidationRejectsBadSettings() {
  using resync::businessdate::ValidateProperty;
  using resync::util::ConfigError;

  ValidateProperty(MakeProperty("04:00"));
  ValidateProperty(MakeProperty("22:00", true));

  assert(Throws<ConfigError>([] { ValidateProperty(MakeProperty("22:00")); }));
  assert(Throws<ConfigError>([] { ValidateProperty(MakeProperty("4:00")); }));
  assert(Throws<ConfigError>([] { ValidateProperty(MakeProperty("24:00")); }));

  auto bad_zone     = MakeProperty("04:00");
  bad_zone.timezone = "Mars/Olympus";
  assert(Throws<ConfigError>([&] { ValidateProperty(bad_zone); }));

  auto bad_date                  = MakeProperty("04:00");
  bad_date.current_business_date = "2026-1-5";
  assert(Throws<ConfigError>([&] { ValidateProperty(bad_date); }));
}

} // namespace

int main() {
  TestAmRolloverAssignsEarlyHoursToPreviousDay();
  TestPmRolloverAssignsLateHoursToNextDay();
  TestOverrideWinsOnlyWhenValid();
  TestClosingInstantAndRange();
  TestDstGapClosesAtTransition();
  TestRepeatedHourDoesNotGoBack();
  TestResolveIsMonotonic();
  TestDateArithmeticCrossesMonthAndLeapDay();
  TestValidationRejectsBadSettings();

  std::cout << "resync_unit_business_date: pass\n";
  return 0;
}
