#pragma once

#include <string>

#include "resync/v1/types.pb.h"

namespace resync::db::model {

/*
  Property (restaurant location) operating configuration.

  current_business_date is the explicit override written by the fiscal
  scheduler after each close; empty means "derive from the clock".
*/
struct PropertyRecord {
  std::string id;
  std::string name;

  // IANA zone name, e.g. America/New_York
  std::string timezone;

  // Local HH:MM at which one business date ends and the next begins.
  std::string rollover_time;

  resync::v1::RolloverMode rollover_mode = resync::v1::ROLLOVER_MODE_AUTO;

  std::string current_business_date;

  bool allow_pm_rollover = false;
  bool auto_clock_out    = false;
};

} // namespace resync::db::model
