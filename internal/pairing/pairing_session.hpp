#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "internal/crypto/crypto.hpp"
#include "internal/pairing/confirmer.hpp"
#include "mprisrelay/v1/pairing.pb.h"

namespace mprisrelay::pairing {

enum class SessionState {
  kInit,
  kKeyExchange,
  kAwaitingConfirmation,
  kEstablished,
  kAborted,
  kRejected,
  kTimedOut,
};

std::string_view ToString(SessionState state);
bool             IsTerminal(SessionState state);

// Why Await() returned.
enum class AwaitOutcome {
  kConfirmed,
  kOperatorRejected,
  kOperatorBlocked,
  kClientRejected,
  kClientGone,
  kTimedOut,
  kAborted,
};

/*
  PairingSession

  One in-progress handshake. Owned by the pairing service and keyed by a
  server-generated id. The local ephemeral key is created with the
  session; secrets are wiped as soon as the session reaches a terminal
  state.

  Thread model: the transport thread drives ReceivePeerKey/Await, the
  stream reader thread posts the client confirmation, the confirmer posts
  the operator decision, and the reaper may expire the session. All of
  them meet under one mutex.
*/
class PairingSession {
 public:
  using Clock = std::chrono::steady_clock;

  PairingSession(std::string id, std::string peer, Clock::time_point deadline);

  PairingSession(const PairingSession&)            = delete;
  PairingSession& operator=(const PairingSession&) = delete;

  const std::string& Id() const {
    return id_;
  }
  const std::string& Peer() const {
    return peer_;
  }
  Clock::time_point Deadline() const {
    return deadline_;
  }

  // INIT -> KEY_EXCHANGE. Throws util::InvalidState out of order and
  // crypto::CryptoError for an unusable peer key.
  void ReceivePeerKey(std::span<const std::uint8_t> client_ephemeral, unsigned sas_digits);

  // KEY_EXCHANGE -> AWAITING_CONFIRMATION.
  void BeginConfirmation();

  void SetOperatorDecision(OperatorDecision decision);
  void SetClientConfirmation(const mprisrelay::v1::ClientConfirmation& confirmation);
  void SetClientGone();

  // Blocks until both sides accepted, either side refused, the client went
  // away, the session was aborted, or the deadline passed.
  AwaitOutcome Await();

  // Moves to a terminal state and wipes key material. No-op when already
  // terminal. Returns true if this call made the transition. Called by the
  // transport thread, which still owns the stream.
  bool Finish(SessionState terminal);

  // Finish(kTimedOut) if the deadline has passed and nobody is inside
  // Await(); used by the reaper.
  bool ExpireIfDue(Clock::time_point now);

  // Finish(kAborted) from outside the transport thread (shutdown).
  void Abort();

  // Runs when the session is finished from outside the transport thread
  // so a blocked stream read can be cancelled.
  void SetCancelHook(std::function<void()> hook);

  SessionState State() const;
  std::string  Sas() const;
  crypto::Bytes LocalPublicKey() const;
  crypto::Bytes RemotePublicKey() const;
  std::optional<mprisrelay::v1::ClientConfirmation> ClientConfirmation() const;

  // Valid only between ReceivePeerKey and Finish.
  crypto::SecretBytes EnrollmentKey() const;
  crypto::SecretBytes TrustKey(std::span<const std::uint8_t> identity_public_key) const;

 private:
  bool FinishLocked(SessionState terminal);
  bool FinishAndCancel(SessionState terminal);

  const std::string       id_;
  const std::string       peer_;
  const Clock::time_point deadline_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  SessionState        state_ = SessionState::kInit;
  crypto::KeyPair     local_;
  crypto::Bytes       remote_public_;
  crypto::SecretBytes shared_;
  std::string         sas_;

  std::optional<OperatorDecision>                   decision_;
  std::optional<mprisrelay::v1::ClientConfirmation> confirmation_;
  bool                                              client_gone_ = false;
  bool                                              awaiting_    = false;

  std::function<void()> cancel_hook_;
};

} // namespace mprisrelay::pairing
