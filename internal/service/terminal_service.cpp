#include "terminal_service.hpp"

#include <stdexcept>

#include "internal/lock/lock_authority.hpp"
#include "internal/replay/local_writer.hpp"
#include "internal/replay/sync_worker.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace resync::service {

using namespace resync::v1;

TerminalService::TerminalService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.writer || !ctx_.sync_worker) throw std::invalid_argument("TerminalService requires a local writer and a sync worker");
}

FlushAndReleaseResponse TerminalService::FlushAndRelease(const FlushAndReleaseRequest& req) {
  return ObserveRpc("TerminalService.FlushAndRelease", [&] {
    if (req.check_id().empty()) throw util::InvalidArgument("flush: check_id is required");

    const auto remaining = ctx_.sync_worker->DrainEntity(req.check_id());

    FlushAndReleaseResponse resp;
    resp.set_flushed(remaining == 0);
    resp.set_remaining_items(static_cast<uint32_t>(remaining));
    if (remaining > 0) {
      RESYNC_LOG_WARN("Flush left replay items queued",
                      {observability::StringField("check_id", req.check_id()), observability::IntField("remaining", static_cast<int64_t>(remaining))});
      return resp;
    }

    if (ctx_.locks) {
      ReleaseLockRequest release;
      release.set_check_id(req.check_id());
      release.set_holder_id(ctx_.node_id);
      try {
        ctx_.locks->Release(release);
      } catch (const std::exception& e) {
        // the requesting authority takes the lock from us either way
        RESYNC_LOG_WARN("Release after flush failed",
                        {observability::StringField("check_id", req.check_id()), observability::StringField("error", e.what())});
      }
    }

    RESYNC_LOG_INFO("Check flushed for lock override", {observability::StringField("check_id", req.check_id()),
                                                        observability::StringField("requester", req.requester_id())});
    return resp;
  });
}

SaveCheckResponse TerminalService::SaveCheck(const SaveCheckRequest& req) {
  return ObserveRpc("TerminalService.SaveCheck", [&] {
    if (!req.has_check()) throw util::InvalidArgument("save check: check is required");

    const auto saved = ctx_.writer->SaveCheck(req.check());

    SaveCheckResponse resp;
    resp.set_replay_id(saved.replay_id);
    resp.set_revision(saved.revision);
    return resp;
  });
}

RecordPaymentResponse TerminalService::RecordPayment(const RecordPaymentRequest& req) {
  return ObserveRpc("TerminalService.RecordPayment", [&] {
    if (!req.has_payment()) throw util::InvalidArgument("record payment: payment is required");

    RecordPaymentResponse resp;
    resp.set_replay_id(ctx_.writer->RecordPayment(req.payment()));
    return resp;
  });
}

RecordTimeEntryResponse TerminalService::RecordTimeEntry(const RecordTimeEntryRequest& req) {
  return ObserveRpc("TerminalService.RecordTimeEntry", [&] {
    if (!req.has_entry()) throw util::InvalidArgument("record time entry: entry is required");

    RecordTimeEntryResponse resp;
    resp.set_replay_id(ctx_.writer->RecordTimeEntry(req.entry()));
    return resp;
  });
}

} // namespace resync::service
