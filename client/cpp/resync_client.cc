#include "client/cpp/resync_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace resync::client {

using namespace resync::v1;

ResyncClient::ResyncClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : channel_(std::move(channel)),
      deadline_(deadline),
      admin_stub_(AdminService::NewStub(channel_)),
      lock_stub_(LockService::NewStub(channel_)),
      sync_stub_(SyncService::NewStub(channel_)),
      terminal_stub_(TerminalService::NewStub(channel_)) {
}

std::shared_ptr<::grpc::Channel> ResyncClient::Connect(const std::string& address) {
  return ::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials());
}

void ResyncClient::ThrowIfError(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }

  const auto message = std::string(action) + " failed: " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw util::NotFound(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw util::AlreadyExists(message);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw util::InvalidState(message);
    case ::grpc::StatusCode::ABORTED:
      throw util::LockConflict(message);
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
      throw util::Unauthorized(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw util::InvalidArgument(message);
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      throw util::ResourceExhausted(message);
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw util::Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

HeartbeatResponse ResyncClient::Heartbeat(const HeartbeatRequest& request, std::chrono::milliseconds timeout) const {
  return Call<HeartbeatResponse>("Heartbeat", timeout, [&](auto* ctx, auto* resp) { return admin_stub_->Heartbeat(ctx, request, resp); });
}

GetStatusResponse ResyncClient::GetStatus() const {
  GetStatusRequest request;
  return Call<GetStatusResponse>("GetStatus", deadline_, [&](auto* ctx, auto* resp) { return admin_stub_->GetStatus(ctx, request, resp); });
}

AcquireLockResponse ResyncClient::Acquire(const AcquireLockRequest& request) const {
  return Call<AcquireLockResponse>("Acquire", deadline_, [&](auto* ctx, auto* resp) { return lock_stub_->Acquire(ctx, request, resp); });
}

ReleaseLockResponse ResyncClient::Release(const ReleaseLockRequest& request) const {
  return Call<ReleaseLockResponse>("Release", deadline_, [&](auto* ctx, auto* resp) { return lock_stub_->Release(ctx, request, resp); });
}

OverrideLockResponse ResyncClient::Override(const OverrideLockRequest& request) const {
  // The authority may wait on a flush-and-release handshake of its own.
  return Call<OverrideLockResponse>("Override", deadline_ * 2, [&](auto* ctx, auto* resp) { return lock_stub_->Override(ctx, request, resp); });
}

GetLockStatusResponse ResyncClient::GetLockStatus(const GetLockStatusRequest& request) const {
  return Call<GetLockStatusResponse>("GetLockStatus", deadline_,
                                     [&](auto* ctx, auto* resp) { return lock_stub_->GetLockStatus(ctx, request, resp); });
}

GetConflictResponse ResyncClient::GetConflict(const GetConflictRequest& request) const {
  return Call<GetConflictResponse>("GetConflict", deadline_, [&](auto* ctx, auto* resp) { return lock_stub_->GetConflict(ctx, request, resp); });
}

ResolveConflictResponse ResyncClient::ResolveConflict(const ResolveConflictRequest& request) const {
  return Call<ResolveConflictResponse>("ResolveConflict", deadline_,
                                       [&](auto* ctx, auto* resp) { return lock_stub_->ResolveConflict(ctx, request, resp); });
}

ListConflictsResponse ResyncClient::ListConflicts(const ListConflictsRequest& request) const {
  return Call<ListConflictsResponse>("ListConflicts", deadline_,
                                     [&](auto* ctx, auto* resp) { return lock_stub_->ListConflicts(ctx, request, resp); });
}

ApplyResponse ResyncClient::Apply(const ApplyRequest& request, std::chrono::milliseconds timeout) const {
  return Call<ApplyResponse>("Apply", timeout, [&](auto* ctx, auto* resp) { return sync_stub_->Apply(ctx, request, resp); });
}

FlushAndReleaseResponse ResyncClient::FlushAndRelease(const FlushAndReleaseRequest& request, std::chrono::milliseconds timeout) const {
  return Call<FlushAndReleaseResponse>("FlushAndRelease", timeout,
                                       [&](auto* ctx, auto* resp) { return terminal_stub_->FlushAndRelease(ctx, request, resp); });
}

SaveCheckResponse ResyncClient::SaveCheck(const SaveCheckRequest& request) const {
  return Call<SaveCheckResponse>("SaveCheck", deadline_, [&](auto* ctx, auto* resp) { return terminal_stub_->SaveCheck(ctx, request, resp); });
}

RecordPaymentResponse ResyncClient::RecordPayment(const RecordPaymentRequest& request) const {
  return Call<RecordPaymentResponse>("RecordPayment", deadline_,
                                     [&](auto* ctx, auto* resp) { return terminal_stub_->RecordPayment(ctx, request, resp); });
}

RecordTimeEntryResponse ResyncClient::RecordTimeEntry(const RecordTimeEntryRequest& request) const {
  return Call<RecordTimeEntryResponse>("RecordTimeEntry", deadline_,
                                       [&](auto* ctx, auto* resp) { return terminal_stub_->RecordTimeEntry(ctx, request, resp); });
}

// ---------------------------------------------------------------------------
// Seam adapters
// ---------------------------------------------------------------------------

RemoteHeartbeat::RemoteHeartbeat(std::shared_ptr<ResyncClient> client, std::string node_id, std::string callback_address)
    : client_(std::move(client)), node_id_(std::move(node_id)), callback_address_(std::move(callback_address)) {
}

bool RemoteHeartbeat::Heartbeat(std::chrono::milliseconds timeout) {
  HeartbeatRequest request;
  request.set_node_id(node_id_);
  request.set_callback_address(callback_address_);
  client_->Heartbeat(request, timeout);
  return true;
}

ChannelHeartbeat::ChannelHeartbeat(std::shared_ptr<::grpc::Channel> channel) : channel_(std::move(channel)) {
}

bool ChannelHeartbeat::Heartbeat(std::chrono::milliseconds timeout) {
  return channel_->WaitForConnected(std::chrono::system_clock::now() + timeout);
}

RemoteStore::RemoteStore(std::shared_ptr<ResyncClient> client, std::string origin_id)
    : client_(std::move(client)), origin_id_(std::move(origin_id)) {
}

uint64_t RemoteStore::Apply(const ReplayItem& item, std::chrono::milliseconds timeout) {
  ApplyRequest request;
  *request.mutable_item() = item;
  request.mutable_item()->set_origin_id(origin_id_);
  request.set_origin_id(origin_id_);
  return client_->Apply(request, timeout).applied_revision();
}

RemoteLockAuthority::RemoteLockAuthority(std::shared_ptr<ResyncClient> client) : client_(std::move(client)) {
}

AcquireLockResponse RemoteLockAuthority::Acquire(const AcquireLockRequest& req) {
  return client_->Acquire(req);
}

ReleaseLockResponse RemoteLockAuthority::Release(const ReleaseLockRequest& req) {
  return client_->Release(req);
}

OverrideLockResponse RemoteLockAuthority::Override(const OverrideLockRequest& req) {
  return client_->Override(req);
}

GetLockStatusResponse RemoteLockAuthority::GetLockStatus(const GetLockStatusRequest& req) {
  return client_->GetLockStatus(req);
}

GetConflictResponse RemoteLockAuthority::GetConflict(const GetConflictRequest& req) {
  return client_->GetConflict(req);
}

ResolveConflictResponse RemoteLockAuthority::ResolveConflict(const ResolveConflictRequest& req) {
  return client_->ResolveConflict(req);
}

ListConflictsResponse RemoteLockAuthority::ListConflicts(const ListConflictsRequest& req) {
  return client_->ListConflicts(req);
}

TerminalChannel::TerminalChannel(std::shared_ptr<connectivity::TerminalPresence> presence, std::string requester_id)
    : presence_(std::move(presence)), requester_id_(std::move(requester_id)) {
}

std::shared_ptr<ResyncClient> TerminalChannel::ClientFor(const std::string& address) {
  std::lock_guard lock(mutex_);

  auto& client = clients_[address];
  if (!client) client = std::make_shared<ResyncClient>(ResyncClient::Connect(address));
  return client;
}

bool TerminalChannel::RequestFlushAndRelease(const std::string& terminal_id, const std::string& check_id, std::chrono::milliseconds timeout) {
  const auto address = presence_->CallbackAddress(terminal_id);
  if (!address || address->empty()) {
    RESYNC_LOG_WARN("No callback address for lock holder", {observability::StringField("terminal_id", terminal_id)});
    return false;
  }

  FlushAndReleaseRequest request;
  request.set_check_id(check_id);
  request.set_requester_id(requester_id_);

  try {
    return ClientFor(*address)->FlushAndRelease(request, timeout).flushed();
  } catch (const std::exception& e) {
    RESYNC_LOG_WARN("Flush and release failed", {observability::StringField("terminal_id", terminal_id),
                                                 observability::StringField("check_id", check_id),
                                                 observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace resync::client
