#pragma once

#include <chrono>

namespace resync::connectivity {

// One heartbeat against an authority. Returning false, throwing or
// exceeding the timeout all count as a miss.
class HeartbeatSender {
 public:
  virtual ~HeartbeatSender() = default;

  virtual bool Heartbeat(std::chrono::milliseconds timeout) = 0;
};

} // namespace resync::connectivity
