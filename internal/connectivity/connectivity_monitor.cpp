#include "connectivity_monitor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace resync::connectivity {

ConnectivityMonitor::ConnectivityMonitor(std::shared_ptr<util::Clock> clock, MonitorOptions options)
    : clock_(std::move(clock)), options_(options) {
  if (options_.missed_heartbeat_threshold == 0) options_.missed_heartbeat_threshold = 1;

  std::scoped_lock lock(mutex_);
  snapshot_ = BuildSnapshotLocked(clock_->Now());
}

void ConnectivityMonitor::AddAuthority(const std::string& name, AuthorityKind kind, std::shared_ptr<HeartbeatSender> sender,
                                       std::chrono::milliseconds interval) {
  std::scoped_lock lock(mutex_);
  Authority        authority;
  authority.kind     = kind;
  authority.sender   = std::move(sender);
  authority.interval = interval;
  authorities_[name] = std::move(authority);
}

std::shared_ptr<const resync::v1::ConnectivityStatus> ConnectivityMonitor::BuildSnapshotLocked(util::TimePoint now) {
  bool cloud       = false;
  bool relay_host  = false;
  bool peripherals = false;
  for (const auto& [_, authority] : authorities_) {
    if (!authority.reachable) continue;
    switch (authority.kind) {
      case AuthorityKind::kCloud:
        cloud = true;
        break;
      case AuthorityKind::kRelayHost:
        relay_host = true;
        break;
      case AuthorityKind::kPeripheral:
        peripherals = true;
        break;
    }
  }

  auto status = std::make_shared<resync::v1::ConnectivityStatus>();
  status->set_mode(ComputeMode(cloud, relay_host, peripherals));
  status->set_cloud_reachable(cloud);
  status->set_relay_host_reachable(relay_host);
  status->set_peripherals_reachable(peripherals);
  status->set_last_checked_ms(util::ToUnixMillis(now));
  status->set_sequence(sequence_);
  return status;
}

void ConnectivityMonitor::RecordHeartbeat(const std::string& name, bool ok, util::TimePoint now) {
  std::shared_ptr<const resync::v1::ConnectivityStatus> published;
  resync::v1::ConnectionMode                            previous_mode;
  {
    std::scoped_lock lock(mutex_);
    auto             it = authorities_.find(name);
    if (it == authorities_.end()) {
      throw util::NotFound("unknown authority: " + name);
    }

    auto& authority = it->second;
    if (ok) {
      authority.consecutive_misses = 0;
      authority.reachable          = true;
    } else {
      ++authority.consecutive_misses;
      if (authority.consecutive_misses >= options_.missed_heartbeat_threshold) {
        authority.reachable = false;
      }
    }

    previous_mode = snapshot_->mode();
    ++sequence_;
    snapshot_ = BuildSnapshotLocked(now);
    published = snapshot_;
  }

  if (published->mode() == previous_mode) return;

  RESYNC_LOG_INFO("Connection mode changed", {observability::StringField("from", ModeName(previous_mode)),
                                              observability::StringField("to", ModeName(published->mode())),
                                              observability::StringField("authority", name)});
  observability::Metrics::Instance().RecordModeTransition(ModeName(published->mode()));

  std::vector<Listener> listeners;
  {
    std::scoped_lock lock(listeners_mutex_);
    for (const auto& [_, listener] : listeners_) listeners.push_back(listener);
  }
  for (const auto& listener : listeners) {
    try {
      listener(*published);
    } catch (const std::exception& e) {
      RESYNC_LOG_ERROR("Connectivity listener failed", {observability::StringField("error", e.what())});
    }
  }
}

void ConnectivityMonitor::Tick(util::TimePoint now) {
  struct Due {
    std::string                      name;
    std::shared_ptr<HeartbeatSender> sender;
  };

  std::vector<Due> due;
  {
    std::scoped_lock lock(mutex_);
    for (auto& [name, authority] : authorities_) {
      if (!authority.sender || now < authority.next_due) continue;
      authority.next_due = now + authority.interval;
      due.push_back({name, authority.sender});
    }
  }

  // heartbeats run without the lock; each carries its own deadline
  for (const auto& item : due) {
    bool ok = false;
    try {
      ok = item.sender->Heartbeat(options_.heartbeat_timeout);
    } catch (const std::exception& e) {
      RESYNC_LOG_WARN("Heartbeat failed", {observability::StringField("authority", item.name), observability::StringField("error", e.what())});
    }
    if (!ok) {
      RESYNC_LOG_DEBUG("Heartbeat missed", {observability::StringField("authority", item.name)});
    }
    RecordHeartbeat(item.name, ok, now);
  }
}

std::shared_ptr<const resync::v1::ConnectivityStatus> ConnectivityMonitor::Snapshot() const {
  std::scoped_lock lock(mutex_);
  return snapshot_;
}

ConnectivityMonitor::Token ConnectivityMonitor::Subscribe(Listener listener) {
  std::scoped_lock lock(listeners_mutex_);
  const Token      token = next_token_++;
  listeners_[token]      = std::move(listener);
  return token;
}

void ConnectivityMonitor::Unsubscribe(Token token) {
  std::scoped_lock lock(listeners_mutex_);
  listeners_.erase(token);
}

} // namespace resync::connectivity
