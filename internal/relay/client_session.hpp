#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/monitor/player_monitor.hpp"
#include "internal/util/blocking_queue.hpp"
#include "mprisrelay/v1/relay.pb.h"

namespace mprisrelay::relay {

enum class CloseReason {
  kOpen,
  kClientDone,
  kClientGone,
  kSlowConsumer,
  kRevoked,
  kShutdown,
};

const char* ToString(CloseReason reason);

/*
  ClientSession

  One authenticated relay connection. Owns the subscription scope and the
  bounded outbound queue drained by the transport's writer.

  The session sees monitor events as an EventSink and forwards those its
  scope covers. A player is "known" to the client once it was sent in a
  snapshot or an appeared event; state changes are only forwarded for
  known players, and disappearing forgets them. That keeps every player's
  events between its appearance and its disappearance.

  When the outbound queue is full the session closes as a slow consumer
  and invokes the close hook; nothing is ever blocked on a client.
*/
class ClientSession final : public monitor::EventSink {
 public:
  using CloseHook = std::function<void()>;

  ClientSession(std::string session_id, std::string identity, std::size_t max_outbound, CloseHook on_close);

  const std::string& Id() const {
    return session_id_;
  }
  const std::string& Identity() const {
    return identity_;
  }

  // Widens the scope; returns the players newly covered, which the
  // caller sends as the snapshot. `current` must be the monitor's view
  // at the same instant.
  std::vector<mprisrelay::v1::Player> Subscribe(const mprisrelay::v1::Subscribe&           request,
                                                const std::vector<mprisrelay::v1::Player>& current);
  void                                Unsubscribe(const mprisrelay::v1::Unsubscribe& request);

  void OnPlayerEvent(const mprisrelay::v1::PlayerEvent& event) override;

  // False once closed (for any reason).
  bool Offer(mprisrelay::v1::ServerMessage message);

  // Blocks for the next message; nullopt once closed and drained.
  std::optional<mprisrelay::v1::ServerMessage> NextOutbound();

  // Server-initiated close. Pending output is dropped and the hook runs.
  void Close(CloseReason reason);

  // The client finished; pending output is still delivered. No hook.
  void Finish();

  CloseReason Reason() const;
  bool        Covers(const std::string& player_id) const;

 private:
  bool CoversLocked(const std::string& player_id) const;
  bool OfferLocked(mprisrelay::v1::ServerMessage message);
  void CloseLocked(CloseReason reason);

  std::string session_id_;
  std::string identity_;
  CloseHook   on_close_;

  util::BlockingQueue<mprisrelay::v1::ServerMessage> outbound_;

  mutable std::mutex    mutex_;
  bool                  all_players_ = false;
  std::set<std::string> player_ids_;
  std::set<std::string> known_;
  CloseReason           reason_ = CloseReason::kOpen;
};

} // namespace mprisrelay::relay
