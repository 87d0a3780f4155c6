#include "mode.hpp"

namespace resync::connectivity {

resync::v1::ConnectionMode ComputeMode(bool cloud_reachable, bool relay_host_reachable, bool peripherals_reachable) {
  if (cloud_reachable) return resync::v1::CONNECTION_MODE_ONLINE;
  if (relay_host_reachable) return resync::v1::CONNECTION_MODE_LAN_DEGRADED;
  if (peripherals_reachable) return resync::v1::CONNECTION_MODE_LOCAL_ONLY;
  return resync::v1::CONNECTION_MODE_ISOLATED;
}

std::string_view ModeName(resync::v1::ConnectionMode mode) {
  switch (mode) {
    case resync::v1::CONNECTION_MODE_ONLINE:
      return "online";
    case resync::v1::CONNECTION_MODE_LAN_DEGRADED:
      return "lan-degraded";
    case resync::v1::CONNECTION_MODE_LOCAL_ONLY:
      return "local-only";
    case resync::v1::CONNECTION_MODE_ISOLATED:
      return "isolated";
    default:
      return "unspecified";
  }
}

bool HasRemoteAuthority(resync::v1::ConnectionMode mode) {
  return mode == resync::v1::CONNECTION_MODE_ONLINE || mode == resync::v1::CONNECTION_MODE_LAN_DEGRADED;
}

} // namespace resync::connectivity
