#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/relay/client_session.hpp"
#include "mprisrelay/v1/relay.pb.h"

namespace mprisrelay::monitor {
class PlayerMonitor;
}
namespace mprisrelay::relay {
class RelayAuthorizer;
}

namespace mprisrelay::service {

inline constexpr std::uint32_t kRelayProtocolVersion = 1;
inline constexpr const char*   kAgentVersion         = "0.1.0";

struct RelayOptions {
  std::size_t               max_outbound_events = 256;
  std::chrono::milliseconds command_timeout{2000};
};

/*
  RelayService

  Transport-independent relay logic: session bookkeeping, sync-then-stream
  subscriptions and command routing. One ClientSession per authenticated
  connection; the transport reads client messages into Handle() and
  writes whatever the session's outbound queue yields.
*/
class RelayService {
 public:
  RelayService(std::shared_ptr<monitor::PlayerMonitor> monitor, std::shared_ptr<relay::RelayAuthorizer> authorizer,
               RelayOptions options);
  ~RelayService();

  RelayService(const RelayService&)            = delete;
  RelayService& operator=(const RelayService&) = delete;

  // Queues the Welcome and starts receiving events. `on_close` runs when
  // the server closes the session. Throws util::Unavailable after
  // Shutdown().
  std::shared_ptr<relay::ClientSession> OpenSession(const std::string& identity, relay::ClientSession::CloseHook on_close);

  // Stops event delivery. Idempotent.
  void CloseSession(const std::shared_ptr<relay::ClientSession>& session);

  // Throws util::Unauthenticated when the identity was revoked meanwhile
  // and util::InvalidArgument for an empty message. Either ends the
  // session.
  void Handle(relay::ClientSession& session, const mprisrelay::v1::ClientMessage& message);

  mprisrelay::v1::CommandResult Execute(const mprisrelay::v1::CommandRequest& request);

  std::vector<mprisrelay::v1::Player> ListPlayers() const;

  // Closes every session with `reason`; returns how many.
  std::size_t DisconnectAll(relay::CloseReason reason);

  void        Shutdown();
  std::size_t ActiveSessions() const;

 private:
  void Subscribe(relay::ClientSession& session, const mprisrelay::v1::Subscribe& request);

  std::shared_ptr<monitor::PlayerMonitor>   monitor_;
  std::shared_ptr<relay::RelayAuthorizer>   authorizer_;
  RelayOptions                              options_;

  mutable std::mutex                                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<relay::ClientSession>> sessions_;
  bool                                                                   stopping_ = false;
};

} // namespace mprisrelay::service
