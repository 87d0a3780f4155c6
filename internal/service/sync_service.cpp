#include "sync_service.hpp"

#include <stdexcept>

#include "internal/replay/authoritative_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace resync::service {

using namespace resync::v1;

SyncService::SyncService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("SyncService requires an authoritative store");
}

ApplyResponse SyncService::Apply(const ApplyRequest& req) {
  return ObserveRpc("SyncService.Apply", [&] {
    if (!req.has_item()) throw util::InvalidArgument("apply: item is required");

    auto item = req.item();
    if (item.origin_id().empty()) item.set_origin_id(req.origin_id());

    ApplyResponse resp;
    resp.set_applied_revision(ctx_.store->Apply(item, std::chrono::milliseconds(0)));

    RESYNC_LOG_DEBUG("Applied replay item", {observability::StringField("replay_id", req.item().id()),
                                             observability::StringField("entity_id", req.item().entity_id()),
                                             observability::StringField("origin", req.origin_id())});
    return resp;
  });
}

} // namespace resync::service
