#include "internal/pairing/pairing_session.hpp"

#include "internal/pairing/pairing_protocol.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::pairing {

std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kInit:
      return "INIT";
    case SessionState::kKeyExchange:
      return "KEY_EXCHANGE";
    case SessionState::kAwaitingConfirmation:
      return "AWAITING_CONFIRMATION";
    case SessionState::kEstablished:
      return "ESTABLISHED";
    case SessionState::kAborted:
      return "ABORTED";
    case SessionState::kRejected:
      return "REJECTED";
    case SessionState::kTimedOut:
      return "TIMED_OUT";
  }
  return "UNKNOWN";
}

bool IsTerminal(SessionState state) {
  return state == SessionState::kEstablished || state == SessionState::kAborted || state == SessionState::kRejected ||
         state == SessionState::kTimedOut;
}

PairingSession::PairingSession(std::string id, std::string peer, Clock::time_point deadline)
    : id_(std::move(id)), peer_(std::move(peer)), deadline_(deadline), local_(crypto::GenerateX25519KeyPair()) {
}

void PairingSession::ReceivePeerKey(std::span<const std::uint8_t> client_ephemeral, unsigned sas_digits) {
  std::lock_guard lock(mutex_);
  if (state_ != SessionState::kInit) {
    throw util::InvalidState("key exchange in state " + std::string(ToString(state_)));
  }
  if (client_ephemeral.size() != crypto::kKeyLength) {
    throw util::InvalidArgument("ephemeral public key must be 32 bytes");
  }

  remote_public_.assign(client_ephemeral.begin(), client_ephemeral.end());
  shared_ = crypto::X25519Agree(local_.private_key.view(), remote_public_);
  sas_    = DeriveSas(shared_.view(), remote_public_, local_.public_key, sas_digits);

  // The ephemeral private key has done its job.
  local_.private_key.clear();
  state_ = SessionState::kKeyExchange;
}

void PairingSession::BeginConfirmation() {
  std::lock_guard lock(mutex_);
  if (state_ != SessionState::kKeyExchange) {
    throw util::InvalidState("confirmation in state " + std::string(ToString(state_)));
  }
  state_ = SessionState::kAwaitingConfirmation;
}

void PairingSession::SetOperatorDecision(OperatorDecision decision) {
  {
    std::lock_guard lock(mutex_);
    if (IsTerminal(state_) || decision_) return;
    decision_ = decision;
  }
  cv_.notify_all();
}

void PairingSession::SetClientConfirmation(const mprisrelay::v1::ClientConfirmation& confirmation) {
  {
    std::lock_guard lock(mutex_);
    if (IsTerminal(state_) || confirmation_) return;
    confirmation_ = confirmation;
  }
  cv_.notify_all();
}

void PairingSession::SetClientGone() {
  {
    std::lock_guard lock(mutex_);
    client_gone_ = true;
  }
  cv_.notify_all();
}

AwaitOutcome PairingSession::Await() {
  std::unique_lock lock(mutex_);

  auto decided = [&] {
    if (IsTerminal(state_) || client_gone_) return true;
    if (decision_ && *decision_ != OperatorDecision::kAccept) return true;
    if (confirmation_ && !confirmation_->accepted()) return true;
    return decision_.has_value() && confirmation_.has_value();
  };

  awaiting_ = true;
  cv_.wait_until(lock, deadline_, decided);
  awaiting_ = false;

  if (state_ == SessionState::kTimedOut) return AwaitOutcome::kTimedOut;
  if (IsTerminal(state_)) return AwaitOutcome::kAborted;
  if (decision_ == OperatorDecision::kReject) return AwaitOutcome::kOperatorRejected;
  if (decision_ == OperatorDecision::kBlock) return AwaitOutcome::kOperatorBlocked;
  if (confirmation_ && !confirmation_->accepted()) return AwaitOutcome::kClientRejected;
  if (client_gone_) return AwaitOutcome::kClientGone;
  if (decision_ && confirmation_) return AwaitOutcome::kConfirmed;
  return AwaitOutcome::kTimedOut;
}

bool PairingSession::Finish(SessionState terminal) {
  bool transitioned = false;
  {
    std::lock_guard lock(mutex_);
    transitioned = FinishLocked(terminal);
  }
  cv_.notify_all();
  return transitioned;
}

bool PairingSession::FinishAndCancel(SessionState terminal) {
  std::function<void()> hook;
  bool                  transitioned = false;
  {
    std::lock_guard lock(mutex_);
    transitioned = FinishLocked(terminal);
    hook         = cancel_hook_;
  }
  cv_.notify_all();
  if (transitioned && hook) hook();
  return transitioned;
}

bool PairingSession::ExpireIfDue(Clock::time_point now) {
  if (now < deadline_) return false;
  {
    // Await() enforces the same deadline and reports it to the client.
    std::lock_guard lock(mutex_);
    if (awaiting_) return false;
  }
  return FinishAndCancel(SessionState::kTimedOut);
}

void PairingSession::Abort() {
  FinishAndCancel(SessionState::kAborted);
}

bool PairingSession::FinishLocked(SessionState terminal) {
  if (IsTerminal(state_)) return false;
  state_ = terminal;
  local_.private_key.clear();
  shared_.clear();
  return true;
}

void PairingSession::SetCancelHook(std::function<void()> hook) {
  std::lock_guard lock(mutex_);
  cancel_hook_ = std::move(hook);
}

SessionState PairingSession::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::string PairingSession::Sas() const {
  std::lock_guard lock(mutex_);
  return sas_;
}

crypto::Bytes PairingSession::LocalPublicKey() const {
  std::lock_guard lock(mutex_);
  return local_.public_key;
}

crypto::Bytes PairingSession::RemotePublicKey() const {
  std::lock_guard lock(mutex_);
  return remote_public_;
}

std::optional<mprisrelay::v1::ClientConfirmation> PairingSession::ClientConfirmation() const {
  std::lock_guard lock(mutex_);
  return confirmation_;
}

crypto::SecretBytes PairingSession::EnrollmentKey() const {
  std::lock_guard lock(mutex_);
  if (shared_.empty()) {
    throw util::InvalidState("session key material is gone");
  }
  return DeriveEnrollmentKey(shared_.view(), remote_public_, local_.public_key);
}

crypto::SecretBytes PairingSession::TrustKey(std::span<const std::uint8_t> identity_public_key) const {
  std::lock_guard lock(mutex_);
  if (shared_.empty()) {
    throw util::InvalidState("session key material is gone");
  }
  return DeriveTrustKey(shared_.view(), remote_public_, local_.public_key, identity_public_key);
}

} // namespace mprisrelay::pairing
