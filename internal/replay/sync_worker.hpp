#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "authoritative_store.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "replay_queue.hpp"

namespace resync::replay {

struct SyncWorkerOptions {
  uint32_t                  batch_size = 10;
  std::chrono::milliseconds dispatch_timeout{5000};
};

/*
  Drains the replay queue into the authoritative store of the current mode:
  the cloud when online, the relay host when lan-degraded, nothing
  otherwise.

  Items of one entity are dispatched strictly in order. Once an item fails,
  later items of the same entity wait for the next pass.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<ReplayQueue> queue, std::shared_ptr<connectivity::ConnectivityMonitor> monitor,
             std::shared_ptr<AuthoritativeStore> cloud, std::shared_ptr<AuthoritativeStore> relay_host, SyncWorkerOptions options = {});

  // One drain pass; returns the number of items acknowledged.
  std::size_t RunOnce();

  // Synchronously dispatches every queued item of one entity. Returns the
  // number still queued afterwards (0 means fully flushed).
  std::size_t DrainEntity(const std::string& entity_id);

 private:
  AuthoritativeStore* Target() const;
  bool                Dispatch(AuthoritativeStore& store, db::model::ReplayItemRecord& item);
  void                PublishBacklog();

  std::shared_ptr<ReplayQueue>                       queue_;
  std::shared_ptr<connectivity::ConnectivityMonitor> monitor_;
  std::shared_ptr<AuthoritativeStore>                cloud_;
  std::shared_ptr<AuthoritativeStore>                relay_host_;
  SyncWorkerOptions                                  options_;

  // RunOnce and DrainEntity never dispatch concurrently.
  std::mutex drain_mutex_;
};

} // namespace resync::replay
