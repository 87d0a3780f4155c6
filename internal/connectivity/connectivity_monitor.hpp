#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/connectivity/mode.hpp"
#include "internal/connectivity/heartbeat_sender.hpp"
#include "internal/util/time.hpp"
#include "resync/v1/types.pb.h"

namespace resync::connectivity {

struct MonitorOptions {
  uint32_t                  missed_heartbeat_threshold = 3;
  std::chrono::milliseconds heartbeat_timeout{2000};
};

/*
  Tracks reachability of the cloud, the relay host and the local
  peripherals, and derives the connection Mode from them.

  - Authorities start unreachable; a fresh node reports isolated.
  - Losing an authority is debounced: it becomes unreachable only after
    missed_heartbeat_threshold consecutive misses.
  - One successful heartbeat restores it immediately.

  RecordHeartbeat() is the single writer. Every call publishes a new
  immutable snapshot; subscribers are notified when the Mode changes.
*/
class ConnectivityMonitor {
 public:
  using Listener = std::function<void(const resync::v1::ConnectivityStatus&)>;
  using Token    = uint64_t;

  ConnectivityMonitor(std::shared_ptr<util::Clock> clock, MonitorOptions options);

  // sender may be null for authorities fed only through RecordHeartbeat().
  void AddAuthority(const std::string& name, AuthorityKind kind, std::shared_ptr<HeartbeatSender> sender, std::chrono::milliseconds interval);

  // Throws util::NotFound for an unregistered authority.
  void RecordHeartbeat(const std::string& name, bool ok, util::TimePoint now);

  // Sends a heartbeat to every authority whose heartbeat is due.
  void Tick(util::TimePoint now);
  void Tick() {
    Tick(clock_->Now());
  }

  std::shared_ptr<const resync::v1::ConnectivityStatus> Snapshot() const;

  resync::v1::ConnectionMode Mode() const {
    return Snapshot()->mode();
  }

  Token Subscribe(Listener listener);
  void  Unsubscribe(Token token);

 private:
  struct Authority {
    AuthorityKind                    kind;
    std::shared_ptr<HeartbeatSender> sender;
    std::chrono::milliseconds        interval;
    uint32_t                         consecutive_misses = 0;
    bool                             reachable          = false;
    util::TimePoint                  next_due{};
  };

  std::shared_ptr<const resync::v1::ConnectivityStatus> BuildSnapshotLocked(util::TimePoint now);

  std::shared_ptr<util::Clock> clock_;
  MonitorOptions               options_;

  mutable std::mutex                                    mutex_;
  std::map<std::string, Authority>                      authorities_;
  std::shared_ptr<const resync::v1::ConnectivityStatus> snapshot_;
  uint64_t                                              sequence_ = 0;

  std::mutex                listeners_mutex_;
  std::map<Token, Listener> listeners_;
  Token                     next_token_ = 1;
};

} // namespace resync::connectivity
