#include "admin_service.hpp"

#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/connectivity/terminal_presence.hpp"
#include "internal/lock/check_lock_manager.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/replay/replay_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace resync::service {

using namespace resync::v1;

namespace {

std::string RoleName(resync::runtime::config::NodeRole role) {
  switch (role) {
    case resync::runtime::config::NODE_ROLE_TERMINAL:
      return "terminal";
    case resync::runtime::config::NODE_ROLE_RELAY_HOST:
      return "relay_host";
    case resync::runtime::config::NODE_ROLE_CLOUD:
      return "cloud";
    default:
      return "unspecified";
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.clock) ctx_.clock = std::make_shared<util::WallClock>();
}

HeartbeatResponse AdminService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("AdminService.Heartbeat", [&] {
    const auto now = ctx_.clock->Now();

    if (ctx_.presence && !req.node_id().empty()) {
      const bool reconnected = ctx_.presence->RecordHeartbeat(req.node_id(), req.callback_address(), now);
      if (reconnected) {
        RESYNC_LOG_INFO("Terminal connected", {observability::StringField("terminal_id", req.node_id()),
                                               observability::StringField("callback", req.callback_address())});
        if (ctx_.lock_manager) ctx_.lock_manager->OnTerminalReconnected(req.node_id());
      }
    }

    HeartbeatResponse resp;
    resp.set_node_id(ctx_.node_id);
    resp.set_server_time_ms(util::ToUnixMillis(now));
    return resp;
  });
}

GetStatusResponse AdminService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("AdminService.GetStatus", [&] {
    GetStatusResponse resp;
    resp.set_node_id(ctx_.node_id);
    resp.set_role(RoleName(ctx_.role));

    if (ctx_.monitor) *resp.mutable_connectivity() = *ctx_.monitor->Snapshot();

    if (ctx_.replay_queue) {
      const auto stats  = ctx_.replay_queue->Stats();
      auto*      replay = resp.mutable_replay();
      replay->set_backlog(stats.backlog);
      replay->set_failed(stats.failed);
      replay->set_oldest_pending_age_ms(static_cast<uint64_t>(stats.oldest_pending_age.count()));
    }

    if (ctx_.recovery) {
      for (auto& stats : ctx_.recovery->GetServiceStats()) *resp.add_services() = std::move(stats);
    }

    if (ctx_.presence) {
      const auto now = ctx_.clock->Now();
      for (const auto& terminal : ctx_.presence->List()) {
        if (ctx_.presence->IsReachable(terminal.terminal_id, now)) resp.add_terminals(terminal.terminal_id);
      }
    }
    return resp;
  });
}

} // namespace resync::service
