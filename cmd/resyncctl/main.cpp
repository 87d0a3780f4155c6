#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/resync_client.h"
#include "internal/connectivity/mode.hpp"

using namespace resync::v1;
using resync::client::ResyncClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  resyncctl <addr> status\n"
            << "  resyncctl <addr> heartbeat <node_id> [callback_address]\n"
            << "  resyncctl <addr> lock <check_id> <requester_id> [active|view]\n"
            << "  resyncctl <addr> release <check_id> <holder_id>\n"
            << "  resyncctl <addr> lock-status <check_id> <observer_id>\n"
            << "  resyncctl <addr> override <check_id> <requester_id> <manager_id> <pin> [--ack-risk]\n"
            << "  resyncctl <addr> conflicts <terminal_id>\n"
            << "  resyncctl <addr> conflict <check_id>\n"
            << "  resyncctl <addr> resolve <check_id> <keep-a|keep-b|merge> <manager_id> <pin> [--ack-risk]\n";
}

static std::optional<Resolution> ParseResolution(const std::string& value) {
  if (value == "keep-a") return RESOLUTION_KEEP_A;
  if (value == "keep-b") return RESOLUTION_KEEP_B;
  if (value == "merge") return RESOLUTION_MERGE;
  return std::nullopt;
}

static const char* IndicatorName(LockIndicator indicator) {
  switch (indicator) {
    case LOCK_INDICATOR_GREEN:
      return "green";
    case LOCK_INDICATOR_YELLOW:
      return "yellow";
    case LOCK_INDICATOR_RED:
      return "red";
    default:
      return "unknown";
  }
}

static void PrintLock(const LockInfo& lock) {
  std::cout << "check=" << lock.check_id() << " locked=" << (lock.locked() ? "true" : "false") << " holder=" << lock.holder_id()
            << " indicator=" << IndicatorName(lock.indicator()) << " conflict_pending=" << (lock.conflict_pending() ? "true" : "false")
            << "\n";
}

static void PrintCheck(const char* label, const Check& check) {
  std::cout << label << ": id=" << check.id() << " revision=" << check.revision() << " canonical=" << (check.canonical() ? "true" : "false")
            << " line_items=" << check.line_items_size() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  ResyncClient client(ResyncClient::Connect(addr));

  try {
    // ------------------------------------------------------------

    if (cmd == "status") {
      auto resp = client.GetStatus();
      std::cout << "node=" << resp.node_id() << " role=" << resp.role()
                << " mode=" << resync::connectivity::ModeName(resp.connectivity().mode()) << "\n";
      std::cout << "replay backlog=" << resp.replay().backlog() << " failed=" << resp.replay().failed()
                << " oldest_pending_age_ms=" << resp.replay().oldest_pending_age_ms() << "\n";
      for (const auto& service : resp.services()) {
        std::cout << "service " << service.name() << " state=" << ServiceState_Name(service.state())
                  << " attempts=" << service.recovery_attempts() << (service.exhausted() ? " exhausted" : "") << "\n";
      }
      for (const auto& terminal : resp.terminals()) std::cout << "terminal " << terminal << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "heartbeat") {
      if (argc < 4) return 1;

      HeartbeatRequest req;
      req.set_node_id(argv[3]);
      if (argc >= 5) req.set_callback_address(argv[4]);

      auto resp = client.Heartbeat(req, std::chrono::milliseconds(5000));
      std::cout << "node=" << resp.node_id() << " server_time_ms=" << resp.server_time_ms() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "lock") {
      if (argc < 5) return 1;

      AcquireLockRequest req;
      req.set_check_id(argv[3]);
      req.set_requester_id(argv[4]);
      req.set_lock_type(argc >= 6 && std::string(argv[5]) == "view" ? LOCK_TYPE_VIEW : LOCK_TYPE_ACTIVE);

      auto resp = client.Acquire(req);
      std::cout << "outcome=" << AcquireOutcome_Name(resp.outcome()) << (resp.local_only() ? " local_only" : "") << "\n";
      PrintLock(resp.lock());
      return resp.outcome() == ACQUIRE_OUTCOME_GRANTED || resp.outcome() == ACQUIRE_OUTCOME_ALREADY_HELD ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "release") {
      if (argc < 5) return 1;

      ReleaseLockRequest req;
      req.set_check_id(argv[3]);
      req.set_holder_id(argv[4]);

      std::cout << (client.Release(req).released() ? "released" : "not held") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "lock-status") {
      if (argc < 5) return 1;

      GetLockStatusRequest req;
      req.set_check_id(argv[3]);
      req.set_observer_id(argv[4]);

      PrintLock(client.GetLockStatus(req).lock());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "override") {
      if (argc < 7) return 1;

      OverrideLockRequest req;
      req.set_check_id(argv[3]);
      req.set_requester_id(argv[4]);
      req.mutable_credential()->set_employee_id(argv[5]);
      req.mutable_credential()->set_pin(argv[6]);
      req.set_acknowledge_risk(argc >= 8 && std::string(argv[7]) == "--ack-risk");

      auto resp = client.Override(req);
      std::cout << "outcome=" << OverrideOutcome_Name(resp.outcome()) << " locked_check=" << resp.locked_check_id() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "conflicts") {
      if (argc < 4) return 1;

      ListConflictsRequest req;
      req.set_terminal_id(argv[3]);

      for (const auto& id : client.ListConflicts(req).check_ids()) std::cout << id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "conflict") {
      if (argc < 4) return 1;

      GetConflictRequest req;
      req.set_check_id(argv[3]);

      auto resp = client.GetConflict(req);
      if (!resp.pending()) {
        std::cout << "no pending conflict\n";
        return 0;
      }
      PrintCheck("original", resp.original());
      PrintCheck("clone", resp.clone());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "resolve") {
      if (argc < 7) return 1;

      auto resolution = ParseResolution(argv[4]);
      if (!resolution) {
        std::cerr << "unsupported resolution: " << argv[4] << "\n";
        return 1;
      }

      ResolveConflictRequest req;
      req.set_check_id(argv[3]);
      req.set_resolution(*resolution);
      req.set_resolver_id(argv[5]);
      req.mutable_credential()->set_employee_id(argv[5]);
      req.mutable_credential()->set_pin(argv[6]);
      req.set_acknowledge_risk(argc >= 8 && std::string(argv[7]) == "--ack-risk");

      auto resp = client.ResolveConflict(req);
      PrintCheck("canonical", resp.canonical());
      for (const auto& id : resp.diverged_line_items()) std::cout << "diverged " << id << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
