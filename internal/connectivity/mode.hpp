#pragma once

#include <string_view>

#include "resync/v1/types.pb.h"

namespace resync::connectivity {

enum class AuthorityKind {
  kCloud,
  kRelayHost,
  kPeripheral,
};

inline constexpr const char* kCloudAuthority     = "cloud";
inline constexpr const char* kRelayHostAuthority = "relay_host";

// Strict precedence: cloud > relay host > peripherals > none.
resync::v1::ConnectionMode ComputeMode(bool cloud_reachable, bool relay_host_reachable, bool peripherals_reachable);

// online, lan-degraded, local-only, isolated
std::string_view ModeName(resync::v1::ConnectionMode mode);

// Modes in which shared lock state lives on a remote authority.
bool HasRemoteAuthority(resync::v1::ConnectionMode mode);

} // namespace resync::connectivity
