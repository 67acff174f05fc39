#include "relay_server.hpp"

#include <thread>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::grpc {

using namespace mprisrelay::v1;

namespace {

std::string Header(const ::grpc::ServerContext& ctx, const char* key) {
  const auto& metadata = ctx.client_metadata();
  auto        it       = metadata.find(key);
  if (it == metadata.end()) return "";
  return std::string(it->second.data(), it->second.length());
}

relay::AuthProof ExtractProof(const ::grpc::ServerContext& ctx) {
  relay::AuthProof proof;
  proof.identity = Header(ctx, relay::kIdentityHeader);
  proof.nonce    = Header(ctx, relay::kNonceHeader);
  proof.proof    = Header(ctx, relay::kProofHeader);

  const auto timestamp = Header(ctx, relay::kTimestampHeader);
  try {
    std::size_t used   = 0;
    proof.timestamp_ms = std::stoll(timestamp, &used);
    if (used != timestamp.size()) throw std::invalid_argument("trailing characters");
  } catch (const std::logic_error&) {
    throw util::Unauthenticated("relay authentication failed");
  }
  return proof;
}

::grpc::Status CloseStatus(relay::CloseReason reason) {
  switch (reason) {
    case relay::CloseReason::kSlowConsumer:
      return {::grpc::StatusCode::RESOURCE_EXHAUSTED, "client could not keep up with events"};
    case relay::CloseReason::kRevoked:
      return {::grpc::StatusCode::UNAUTHENTICATED, "trust was revoked"};
    case relay::CloseReason::kShutdown:
      return {::grpc::StatusCode::UNAVAILABLE, "agent is shutting down"};
    case relay::CloseReason::kClientGone:
      return {::grpc::StatusCode::CANCELLED, "client went away"};
    case relay::CloseReason::kOpen:
    case relay::CloseReason::kClientDone:
      break;
  }
  return ::grpc::Status::OK;
}

} // namespace

RelayServer::RelayServer(std::shared_ptr<mprisrelay::service::RelayService>  svc,
                         std::shared_ptr<mprisrelay::relay::RelayAuthorizer> authorizer)
    : service_(std::move(svc)), authorizer_(std::move(authorizer)) {}

std::string RelayServer::Authenticate(const ::grpc::ServerContext& ctx, const char* method) {
  return authorizer_->Authorize(method, ExtractProof(ctx));
}

::grpc::Status RelayServer::Connect(::grpc::ServerContext* ctx,
                                    ::grpc::ServerReaderWriter<ServerMessage, ClientMessage>* stream) {
  std::shared_ptr<relay::ClientSession> session;
  try {
    const auto identity = Authenticate(*ctx, relay::kConnectMethod);
    session             = service_->OpenSession(identity, [ctx] { ctx->TryCancel(); });
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  // Writes run here so a slow client never stalls reading its commands.
  std::thread writer([&] {
    while (auto message = session->NextOutbound()) {
      if (!stream->Write(*message)) {
        session->Close(relay::CloseReason::kClientGone);
        return;
      }
    }
  });

  ::grpc::Status status = ::grpc::Status::OK;
  try {
    ClientMessage message;
    while (stream->Read(&message)) {
      service_->Handle(*session, message);
    }
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_WARN("Relay session failed", {observability::StringField("session_id", session->Id()),
                                                 observability::StringField("error", e.what())});
    status = ToStatus(e);
  }

  service_->CloseSession(session);
  session->Finish();
  writer.join();

  if (status.ok()) status = CloseStatus(session->Reason());
  return status;
}

::grpc::Status RelayServer::ListPlayers(::grpc::ServerContext* ctx, const ListPlayersRequest*,
                                        ListPlayersResponse* resp) {
  try {
    Authenticate(*ctx, relay::kListPlayersMethod);
    for (auto& player : service_->ListPlayers()) {
      *resp->add_players() = std::move(player);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mprisrelay::grpc
