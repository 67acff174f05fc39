#include "internal/service/relay_service.hpp"

#include "internal/crypto/crypto.hpp"
#include "internal/monitor/player_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/player/player_facade.hpp"
#include "internal/relay/relay_authorizer.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::service {

RelayService::RelayService(std::shared_ptr<monitor::PlayerMonitor>  monitor,
                           std::shared_ptr<relay::RelayAuthorizer> authorizer, RelayOptions options)
    : monitor_(std::move(monitor)), authorizer_(std::move(authorizer)), options_(options) {
}

RelayService::~RelayService() {
  Shutdown();
}

std::shared_ptr<relay::ClientSession> RelayService::OpenSession(const std::string&              identity,
                                                                relay::ClientSession::CloseHook on_close) {
  auto session = std::make_shared<relay::ClientSession>(crypto::ToHex(crypto::RandomBytes(8)), identity,
                                                        options_.max_outbound_events, std::move(on_close));

  mprisrelay::v1::ServerMessage welcome;
  welcome.mutable_welcome()->set_protocol_version(kRelayProtocolVersion);
  welcome.mutable_welcome()->set_agent_version(kAgentVersion);
  welcome.mutable_welcome()->set_identity(identity);
  session->Offer(std::move(welcome));

  {
    std::lock_guard lock(mutex_);
    if (stopping_) throw util::Unavailable("relay is shutting down");
    sessions_[session->Id()] = session;
  }
  monitor_->AddSink(session.get());

  MPRISRELAY_LOG_INFO("Relay session opened", {observability::StringField("session_id", session->Id()),
                                               observability::StringField("identity", identity)});
  return session;
}

void RelayService::CloseSession(const std::shared_ptr<relay::ClientSession>& session) {
  {
    std::lock_guard lock(mutex_);
    if (sessions_.erase(session->Id()) == 0) return;
  }
  monitor_->RemoveSink(session.get());

  MPRISRELAY_LOG_INFO("Relay session closed", {observability::StringField("session_id", session->Id()),
                                               observability::StringField("identity", session->Identity()),
                                               observability::StringField("reason", relay::ToString(session->Reason()))});
}

void RelayService::Handle(relay::ClientSession& session, const mprisrelay::v1::ClientMessage& message) {
  if (!authorizer_->IsTrusted(session.Identity())) {
    throw util::Unauthenticated("trust for " + session.Identity() + " was revoked");
  }

  switch (message.kind_case()) {
    case mprisrelay::v1::ClientMessage::kSubscribe:
      Subscribe(session, message.subscribe());
      return;

    case mprisrelay::v1::ClientMessage::kUnsubscribe:
      session.Unsubscribe(message.unsubscribe());
      return;

    case mprisrelay::v1::ClientMessage::kCommand: {
      mprisrelay::v1::ServerMessage reply;
      *reply.mutable_command_result() = Execute(message.command());
      session.Offer(std::move(reply));
      return;
    }

    case mprisrelay::v1::ClientMessage::KIND_NOT_SET:
      break;
  }
  throw util::InvalidArgument("empty client message");
}

void RelayService::Subscribe(relay::ClientSession& session, const mprisrelay::v1::Subscribe& request) {
  // Under the monitor's dispatch lock: no event can slip between the
  // snapshot and the first streamed event.
  monitor_->WithSnapshot([&](const std::vector<mprisrelay::v1::Player>& current) {
    mprisrelay::v1::ServerMessage snapshot;
    for (auto& player : session.Subscribe(request, current)) {
      *snapshot.mutable_snapshot()->add_players() = std::move(player);
    }
    snapshot.mutable_snapshot();
    session.Offer(std::move(snapshot));
  });
}

mprisrelay::v1::CommandResult RelayService::Execute(const mprisrelay::v1::CommandRequest& request) {
  mprisrelay::v1::CommandResult result;
  if (request.command().player_id().empty()) {
    result = player::Rejected(mprisrelay::v1::REJECT_REASON_INVALID_ARGUMENT, "command names no player");
  } else {
    result = monitor_->Execute(request.command(), options_.command_timeout);
  }
  result.set_request_id(request.request_id());

  if (!result.accepted()) {
    MPRISRELAY_LOG_DEBUG("Command rejected",
                         {observability::StringField("player_id", request.command().player_id()),
                          observability::StringField("reason", mprisrelay::v1::RejectReason_Name(result.reason())),
                          observability::StringField("detail", result.detail())});
  }
  return result;
}

std::vector<mprisrelay::v1::Player> RelayService::ListPlayers() const {
  return monitor_->Players();
}

std::size_t RelayService::DisconnectAll(relay::CloseReason reason) {
  std::vector<std::shared_ptr<relay::ClientSession>> sessions;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, session] : sessions_) sessions.push_back(session);
  }
  for (const auto& session : sessions) session->Close(reason);
  return sessions.size();
}

void RelayService::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    stopping_ = true;
  }
  const auto closed = DisconnectAll(relay::CloseReason::kShutdown);
  if (closed > 0) {
    MPRISRELAY_LOG_INFO("Relay sessions closed for shutdown", {observability::IntField("sessions", closed)});
  }
}

std::size_t RelayService::ActiveSessions() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

} // namespace mprisrelay::service
