#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

namespace resync::util { class Clock; }
namespace resync::db { class Repository; }
namespace resync::connectivity {
class ConnectivityMonitor;
class TerminalPresence;
}
namespace resync::lock {
class LockAuthority;
class CheckLockManager;
}
namespace resync::replay {
class AuthoritativeStore;
class LocalWriter;
class ReplayQueue;
class SyncWorker;
}
namespace resync::recovery { class RecoveryManager; }

namespace resync::service {

/*
  Dependency container shared by all services.

  Authority nodes (relay host, cloud) fill presence, lock_manager and
  store; terminals fill replay_queue, sync_worker and writer. locks is the
  manager itself on an authority and the mode-routing client on a
  terminal.
*/
struct ServiceContext {
  std::string                          node_id;
  resync::runtime::config::NodeRole    role = resync::runtime::config::NODE_ROLE_UNSPECIFIED;

  std::shared_ptr<util::Clock>                       clock;
  std::shared_ptr<db::Repository>                    repository;
  std::shared_ptr<connectivity::ConnectivityMonitor> monitor;
  std::shared_ptr<connectivity::TerminalPresence>    presence;
  std::shared_ptr<lock::LockAuthority>               locks;
  std::shared_ptr<lock::CheckLockManager>            lock_manager;
  std::shared_ptr<replay::AuthoritativeStore>        store;
  std::shared_ptr<replay::ReplayQueue>               replay_queue;
  std::shared_ptr<replay::SyncWorker>                sync_worker;
  std::shared_ptr<replay::LocalWriter>               writer;
  std::shared_ptr<recovery::RecoveryManager>         recovery;
};

} // namespace resync::service
