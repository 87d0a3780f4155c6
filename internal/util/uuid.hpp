#pragma once

#include <string>

namespace resync::util {

// Time-ordered RFC 9562 version 7 UUID in canonical form. Ids minted on
// different terminals while offline still sort roughly by creation time,
// which keeps replay and audit tables append-mostly.
std::string NewId();

} // namespace resync::util
