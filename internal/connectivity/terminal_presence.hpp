#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/lock/holder.hpp"

namespace resync::connectivity {

/*
  Authority-side record of terminal heartbeats.

  A terminal is reachable while its last heartbeat is younger than
  missed_threshold * heartbeat_interval.
*/
class TerminalPresence final : public lock::HolderReachability {
 public:
  struct Entry {
    std::string     terminal_id;
    std::string     callback_address;
    util::TimePoint last_seen{};
  };

  TerminalPresence(std::chrono::milliseconds heartbeat_interval, uint32_t missed_threshold);

  // Returns true when the terminal was unknown or had gone unreachable.
  bool RecordHeartbeat(const std::string& terminal_id, const std::string& callback_address, util::TimePoint now);

  bool IsReachable(const std::string& terminal_id, util::TimePoint now) const override;

  std::optional<std::string> CallbackAddress(const std::string& terminal_id) const;

  std::vector<Entry> List() const;

 private:
  bool FreshLocked(const Entry& entry, util::TimePoint now) const;

  std::chrono::milliseconds window_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> terminals_;
};

} // namespace resync::connectivity
