#include "internal/relay/client_session.hpp"

#include "internal/observability/logging.hpp"

namespace mprisrelay::relay {

const char* ToString(CloseReason reason) {
  switch (reason) {
    case CloseReason::kOpen:
      return "open";
    case CloseReason::kClientDone:
      return "client_done";
    case CloseReason::kClientGone:
      return "client_gone";
    case CloseReason::kSlowConsumer:
      return "slow_consumer";
    case CloseReason::kRevoked:
      return "revoked";
    case CloseReason::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

ClientSession::ClientSession(std::string session_id, std::string identity, std::size_t max_outbound,
                             CloseHook on_close)
    : session_id_(std::move(session_id)),
      identity_(std::move(identity)),
      on_close_(std::move(on_close)),
      outbound_(max_outbound) {
}

std::vector<mprisrelay::v1::Player> ClientSession::Subscribe(const mprisrelay::v1::Subscribe&           request,
                                                            const std::vector<mprisrelay::v1::Player>& current) {
  std::lock_guard lock(mutex_);
  if (request.all_players()) all_players_ = true;
  for (const auto& id : request.player_ids()) player_ids_.insert(id);

  std::vector<mprisrelay::v1::Player> newly;
  for (const auto& player : current) {
    if (!CoversLocked(player.player_id()) || known_.contains(player.player_id())) continue;
    known_.insert(player.player_id());
    newly.push_back(player);
  }
  return newly;
}

void ClientSession::Unsubscribe(const mprisrelay::v1::Unsubscribe& request) {
  std::lock_guard lock(mutex_);
  if (request.all_players()) {
    all_players_ = false;
    player_ids_.clear();
  }
  for (const auto& id : request.player_ids()) player_ids_.erase(id);

  std::erase_if(known_, [&](const std::string& id) { return !CoversLocked(id); });
}

bool ClientSession::Covers(const std::string& player_id) const {
  std::lock_guard lock(mutex_);
  return CoversLocked(player_id);
}

bool ClientSession::CoversLocked(const std::string& player_id) const {
  return all_players_ || player_ids_.contains(player_id);
}

void ClientSession::OnPlayerEvent(const mprisrelay::v1::PlayerEvent& event) {
  std::lock_guard lock(mutex_);
  if (reason_ != CloseReason::kOpen) return;

  switch (event.kind_case()) {
    case mprisrelay::v1::PlayerEvent::kAppeared: {
      const auto& id = event.appeared().player().player_id();
      if (!CoversLocked(id)) return;
      known_.insert(id);
      break;
    }
    case mprisrelay::v1::PlayerEvent::kStateChanged: {
      if (!known_.contains(event.state_changed().player().player_id())) return;
      break;
    }
    case mprisrelay::v1::PlayerEvent::kDisappeared: {
      if (known_.erase(event.disappeared().player_id()) == 0) return;
      break;
    }
    case mprisrelay::v1::PlayerEvent::KIND_NOT_SET:
      return;
  }

  mprisrelay::v1::ServerMessage message;
  *message.mutable_event() = event;
  OfferLocked(std::move(message));
}

bool ClientSession::Offer(mprisrelay::v1::ServerMessage message) {
  std::lock_guard lock(mutex_);
  return OfferLocked(std::move(message));
}

bool ClientSession::OfferLocked(mprisrelay::v1::ServerMessage message) {
  if (reason_ != CloseReason::kOpen) return false;
  if (outbound_.TryEnqueue(std::move(message))) return true;

  MPRISRELAY_LOG_WARN("Relay client too slow; disconnecting", {observability::StringField("session_id", session_id_),
                                                               observability::StringField("identity", identity_)});
  CloseLocked(CloseReason::kSlowConsumer);
  return false;
}

std::optional<mprisrelay::v1::ServerMessage> ClientSession::NextOutbound() {
  return outbound_.Dequeue();
}

void ClientSession::Close(CloseReason reason) {
  std::lock_guard lock(mutex_);
  CloseLocked(reason);
}

void ClientSession::CloseLocked(CloseReason reason) {
  if (reason_ != CloseReason::kOpen) return;
  reason_ = reason;
  outbound_.Close();
  if (on_close_) on_close_();
}

void ClientSession::Finish() {
  std::lock_guard lock(mutex_);
  if (reason_ == CloseReason::kOpen) reason_ = CloseReason::kClientDone;
  outbound_.Shutdown();
}

CloseReason ClientSession::Reason() const {
  std::lock_guard lock(mutex_);
  return reason_;
}

} // namespace mprisrelay::relay
