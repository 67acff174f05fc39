#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "internal/pairing/confirmer.hpp"
#include "internal/pairing/pairing_session.hpp"
#include "mprisrelay/v1/pairing.pb.h"

namespace mprisrelay::credentials {
class CredentialStore;
}
namespace mprisrelay::notify {
class Notifier;
}

namespace mprisrelay::service {

struct PairingOptions {
  std::chrono::seconds confirmation_timeout{60};
  std::size_t          max_sessions = 4;
  unsigned             sas_digits   = 6;
};

/*
  PairingService

  The pairing authenticator. Runs the SAS-confirmed handshake for each
  inbound attempt and, on success only, writes a trust record.

  Transport adapters drive a session as:

    Open(peer) -> Exchange(hello) -> [reader posts confirmation]
               -> Conclude() -> Close()

  Sessions are independent and keyed by a server-generated id. A reaper
  thread enforces deadlines while a session is waiting on the network.
*/
class PairingService {
 public:
  PairingService(std::shared_ptr<credentials::CredentialStore> store, std::shared_ptr<pairing::Confirmer> confirmer,
                 std::shared_ptr<notify::Notifier> notifier, PairingOptions options);
  ~PairingService();

  PairingService(const PairingService&)            = delete;
  PairingService& operator=(const PairingService&) = delete;

  void Start();
  // Aborts every open session.
  void Stop();

  // Throws util::PermissionDenied for blocked hosts and
  // util::ResourceExhausted when too many sessions are pending.
  std::shared_ptr<pairing::PairingSession> Open(const std::string& peer);

  // INIT -> AWAITING_CONFIRMATION; prompts the operator.
  mprisrelay::v1::ServerHello Exchange(pairing::PairingSession& session, const mprisrelay::v1::ClientHello& hello);

  // Waits for both confirmations and settles the session.
  mprisrelay::v1::PairingResult Conclude(pairing::PairingSession& session);

  // Settles the session as ABORTED if still open and forgets it.
  void Close(const std::shared_ptr<pairing::PairingSession>& session);

  std::size_t ActiveSessions() const;
  bool        IsBlocked(const std::string& peer) const;

 private:
  mprisrelay::v1::PairingResult Enroll(pairing::PairingSession& session);
  void                          ReapLoop();
  void                          NotifyOutcome(const pairing::PairingSession& session,
                                              const mprisrelay::v1::PairingResult& result);

  std::shared_ptr<credentials::CredentialStore> store_;
  std::shared_ptr<pairing::Confirmer>           confirmer_;
  std::shared_ptr<notify::Notifier>             notifier_;
  PairingOptions                                options_;

  mutable std::mutex                                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<pairing::PairingSession>> sessions_;
  std::unordered_map<std::string, std::string>                              client_names_;
  std::unordered_set<std::string>                                           blocked_hosts_;

  std::condition_variable reaper_cv_;
  std::thread             reaper_;
  bool                    stopping_ = false;
};

// "ipv4:10.0.0.2:51234" -> "ipv4:10.0.0.2"
std::string PeerHost(const std::string& peer);

} // namespace mprisrelay::service
