#include "terminal_presence.hpp"

#include <algorithm>

namespace resync::connectivity {

TerminalPresence::TerminalPresence(std::chrono::milliseconds heartbeat_interval, uint32_t missed_threshold)
    : window_(heartbeat_interval * std::max<uint32_t>(missed_threshold, 1)) {
}

bool TerminalPresence::FreshLocked(const Entry& entry, util::TimePoint now) const {
  return now - entry.last_seen < window_;
}

bool TerminalPresence::RecordHeartbeat(const std::string& terminal_id, const std::string& callback_address, util::TimePoint now) {
  std::scoped_lock lock(mutex_);
  auto             it = terminals_.find(terminal_id);
  if (it == terminals_.end()) {
    terminals_[terminal_id] = Entry{terminal_id, callback_address, now};
    return true;
  }

  const bool reconnected = !FreshLocked(it->second, now);
  it->second.last_seen   = now;
  if (!callback_address.empty()) it->second.callback_address = callback_address;
  return reconnected;
}

bool TerminalPresence::IsReachable(const std::string& terminal_id, util::TimePoint now) const {
  std::scoped_lock lock(mutex_);
  auto             it = terminals_.find(terminal_id);
  return it != terminals_.end() && FreshLocked(it->second, now);
}

std::optional<std::string> TerminalPresence::CallbackAddress(const std::string& terminal_id) const {
  std::scoped_lock lock(mutex_);
  auto             it = terminals_.find(terminal_id);
  if (it == terminals_.end() || it->second.callback_address.empty()) return std::nullopt;
  return it->second.callback_address;
}

std::vector<TerminalPresence::Entry> TerminalPresence::List() const {
  std::vector<Entry> out;
  {
    std::scoped_lock lock(mutex_);
    out.reserve(terminals_.size());
    for (const auto& [_, entry] : terminals_) out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) { return a.terminal_id < b.terminal_id; });
  return out;
}

} // namespace resync::connectivity
