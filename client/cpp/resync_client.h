#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/connectivity/heartbeat_sender.hpp"
#include "internal/connectivity/terminal_presence.hpp"
#include "internal/lock/holder.hpp"
#include "internal/lock/lock_authority.hpp"
#include "internal/replay/authoritative_store.hpp"
#include "resync/v1/admin_service.grpc.pb.h"
#include "resync/v1/lock_service.grpc.pb.h"
#include "resync/v1/sync_service.grpc.pb.h"
#include "resync/v1/terminal_service.grpc.pb.h"

namespace resync::client {

/*
  Blocking client for a resync node.

  Every call carries a deadline; a failed call throws the util exception
  matching its status code (UNAVAILABLE and DEADLINE_EXCEEDED become
  util::Unavailable).
*/
class ResyncClient {
 public:
  explicit ResyncClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline = std::chrono::milliseconds(5000));

  static std::shared_ptr<::grpc::Channel> Connect(const std::string& address);

  resync::v1::HeartbeatResponse Heartbeat(const resync::v1::HeartbeatRequest& request, std::chrono::milliseconds timeout) const;
  resync::v1::GetStatusResponse GetStatus() const;

  resync::v1::AcquireLockResponse     Acquire(const resync::v1::AcquireLockRequest& request) const;
  resync::v1::ReleaseLockResponse     Release(const resync::v1::ReleaseLockRequest& request) const;
  resync::v1::OverrideLockResponse    Override(const resync::v1::OverrideLockRequest& request) const;
  resync::v1::GetLockStatusResponse   GetLockStatus(const resync::v1::GetLockStatusRequest& request) const;
  resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& request) const;
  resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& request) const;
  resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& request) const;

  resync::v1::ApplyResponse Apply(const resync::v1::ApplyRequest& request, std::chrono::milliseconds timeout) const;

  resync::v1::FlushAndReleaseResponse FlushAndRelease(const resync::v1::FlushAndReleaseRequest& request,
                                                      std::chrono::milliseconds               timeout) const;
  resync::v1::SaveCheckResponse       SaveCheck(const resync::v1::SaveCheckRequest& request) const;
  resync::v1::RecordPaymentResponse   RecordPayment(const resync::v1::RecordPaymentRequest& request) const;
  resync::v1::RecordTimeEntryResponse RecordTimeEntry(const resync::v1::RecordTimeEntryRequest& request) const;

 private:
  static void ThrowIfError(const ::grpc::Status& status, std::string_view action);

  template <typename Response, typename Fn>
  Response Call(std::string_view action, std::chrono::milliseconds timeout, Fn&& fn) const {
    ::grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
    Response response;
    ThrowIfError(fn(&ctx, &response), action);
    return response;
  }

  std::shared_ptr<::grpc::Channel>                      channel_;
  std::chrono::milliseconds                             deadline_;
  std::unique_ptr<resync::v1::AdminService::Stub>       admin_stub_;
  std::unique_ptr<resync::v1::LockService::Stub>        lock_stub_;
  std::unique_ptr<resync::v1::SyncService::Stub>        sync_stub_;
  std::unique_ptr<resync::v1::TerminalService::Stub>    terminal_stub_;
};

// Heartbeat against a cloud or relay host; also registers this terminal's
// presence and callback address there.
class RemoteHeartbeat final : public connectivity::HeartbeatSender {
 public:
  RemoteHeartbeat(std::shared_ptr<ResyncClient> client, std::string node_id, std::string callback_address);

  bool Heartbeat(std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<ResyncClient> client_;
  std::string                   node_id_;
  std::string                   callback_address_;
};

// Peripheral agents answer no resync RPC; reachability is channel readiness.
class ChannelHeartbeat final : public connectivity::HeartbeatSender {
 public:
  explicit ChannelHeartbeat(std::shared_ptr<::grpc::Channel> channel);

  bool Heartbeat(std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<::grpc::Channel> channel_;
};

class RemoteStore final : public replay::AuthoritativeStore {
 public:
  RemoteStore(std::shared_ptr<ResyncClient> client, std::string origin_id);

  uint64_t Apply(const resync::v1::ReplayItem& item, std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<ResyncClient> client_;
  std::string                   origin_id_;
};

class RemoteLockAuthority final : public lock::LockAuthority {
 public:
  explicit RemoteLockAuthority(std::shared_ptr<ResyncClient> client);

  resync::v1::AcquireLockResponse   Acquire(const resync::v1::AcquireLockRequest& req) override;
  resync::v1::ReleaseLockResponse   Release(const resync::v1::ReleaseLockRequest& req) override;
  resync::v1::OverrideLockResponse  Override(const resync::v1::OverrideLockRequest& req) override;
  resync::v1::GetLockStatusResponse GetLockStatus(const resync::v1::GetLockStatusRequest& req) override;

  resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& req) override;
  resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& req) override;
  resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& req) override;

 private:
  std::shared_ptr<ResyncClient> client_;
};

// Authority-side flush-and-release through the holder's TerminalService,
// addressed by the callback it registered with its heartbeats.
class TerminalChannel final : public lock::HolderChannel {
 public:
  TerminalChannel(std::shared_ptr<connectivity::TerminalPresence> presence, std::string requester_id);

  bool RequestFlushAndRelease(const std::string& terminal_id, const std::string& check_id, std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<ResyncClient> ClientFor(const std::string& address);

  std::shared_ptr<connectivity::TerminalPresence> presence_;
  std::string                                     requester_id_;

  std::mutex                                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<ResyncClient>> clients_;
};

} // namespace resync::client
