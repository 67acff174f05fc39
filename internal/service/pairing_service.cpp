#include "pairing_service.hpp"

#include <stdexcept>
#include <vector>

#include "internal/credentials/credential_store.hpp"
#include "internal/crypto/crypto.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pairing/pairing_protocol.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::service {

using namespace mprisrelay::v1;
using pairing::AwaitOutcome;
using pairing::PairingSession;
using pairing::SessionState;

namespace {

constexpr auto        kReapInterval      = std::chrono::milliseconds(250);
constexpr std::size_t kMaxClientNameSize = 128;

PairingResult MakeResult(PairingOutcome outcome, std::string detail) {
  PairingResult result;
  result.set_outcome(outcome);
  result.set_detail(std::move(detail));
  return result;
}

std::string_view OutcomeName(PairingOutcome outcome) {
  switch (outcome) {
    case PAIRING_OUTCOME_ESTABLISHED:
      return "established";
    case PAIRING_OUTCOME_REJECTED_BY_OPERATOR:
      return "rejected_by_operator";
    case PAIRING_OUTCOME_REJECTED_BY_CLIENT:
      return "rejected_by_client";
    case PAIRING_OUTCOME_CODE_MISMATCH:
      return "code_mismatch";
    case PAIRING_OUTCOME_TIMED_OUT:
      return "timed_out";
    case PAIRING_OUTCOME_ABORTED:
      return "aborted";
    default:
      return "unspecified";
  }
}

} // namespace

std::string PeerHost(const std::string& peer) {
  auto colon = peer.rfind(':');
  auto first = peer.find(':');
  if (colon == std::string::npos || colon == first) return peer;
  return peer.substr(0, colon);
}

PairingService::PairingService(std::shared_ptr<credentials::CredentialStore> store,
                               std::shared_ptr<pairing::Confirmer> confirmer, std::shared_ptr<notify::Notifier> notifier,
                               PairingOptions options)
    : store_(std::move(store)), confirmer_(std::move(confirmer)), notifier_(std::move(notifier)), options_(options) {
  if (!store_ || !confirmer_) {
    throw std::invalid_argument("PairingService requires a credential store and a confirmer");
  }
  if (options_.sas_digits < pairing::kMinSasDigits || options_.sas_digits > pairing::kMaxSasDigits) {
    throw std::invalid_argument("SAS digits out of range");
  }
}

PairingService::~PairingService() {
  Stop();
}

void PairingService::Start() {
  std::lock_guard lock(mutex_);
  if (reaper_.joinable()) return;
  stopping_ = false;
  reaper_   = std::thread(&PairingService::ReapLoop, this);
}

void PairingService::Stop() {
  std::vector<std::shared_ptr<PairingSession>> open;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    for (auto& [_, session] : sessions_) open.push_back(session);
  }
  reaper_cv_.notify_all();
  if (reaper_.joinable()) reaper_.join();

  for (auto& session : open) {
    session->Abort();
  }
}

std::shared_ptr<PairingSession> PairingService::Open(const std::string& peer) {
  const auto host = PeerHost(peer);

  std::lock_guard lock(mutex_);
  if (stopping_) {
    throw util::Unavailable("agent is shutting down");
  }
  if (blocked_hosts_.contains(host)) {
    MPRISRELAY_LOG_WARN("Pairing attempt from blocked peer", {observability::StringField("peer", peer)});
    throw util::PermissionDenied("pairing from this host has been blocked");
  }
  if (sessions_.size() >= options_.max_sessions) {
    MPRISRELAY_LOG_WARN("Too many pending pairing sessions", {observability::StringField("peer", peer)});
    throw util::ResourceExhausted("too many pending pairing requests");
  }

  auto id       = crypto::ToHex(crypto::RandomBytes(16));
  auto deadline = PairingSession::Clock::now() + options_.confirmation_timeout;
  auto session  = std::make_shared<PairingSession>(id, peer, deadline);
  sessions_.emplace(id, session);

  MPRISRELAY_LOG_INFO("Pairing session opened", {observability::StringField("session", id),
                                                 observability::StringField("peer", peer)});
  return session;
}

ServerHello PairingService::Exchange(PairingSession& session, const ClientHello& hello) {
  if (hello.client_name().size() > kMaxClientNameSize) {
    throw util::InvalidArgument("client name too long");
  }

  try {
    session.ReceivePeerKey(crypto::AsBytes(hello.ephemeral_public_key()), options_.sas_digits);
  } catch (const crypto::CryptoError& e) {
    throw util::InvalidArgument(std::string("unusable ephemeral key: ") + e.what());
  }
  session.BeginConfirmation();

  {
    std::lock_guard lock(mutex_);
    client_names_[session.Id()] = hello.client_name();
  }

  pairing::PairingPrompt prompt;
  prompt.session_id  = session.Id();
  prompt.peer        = session.Peer();
  prompt.client_name = hello.client_name();
  prompt.sas         = session.Sas();
  prompt.timeout     = options_.confirmation_timeout;

  std::weak_ptr<PairingSession> weak;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session.Id());
    if (it != sessions_.end()) weak = it->second;
  }
  confirmer_->Prompt(prompt, [weak](pairing::OperatorDecision decision) {
    if (auto s = weak.lock()) s->SetOperatorDecision(decision);
  });
  if (notifier_) {
    notifier_->Notify("Pairing request",
                      (hello.client_name().empty() ? session.Peer() : hello.client_name()) + " wants to pair. Code: " + prompt.sas);
  }

  ServerHello reply;
  reply.set_session_id(session.Id());
  reply.set_ephemeral_public_key(crypto::ToString(session.LocalPublicKey()));
  reply.set_sas(prompt.sas);
  reply.set_confirmation_timeout_ms(static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(options_.confirmation_timeout).count()));

  MPRISRELAY_LOG_INFO("Pairing awaiting confirmation",
                      {observability::StringField("session", session.Id()),
                       observability::StringField("client", hello.client_name()),
                       observability::DurationField("timeout", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                                   options_.confirmation_timeout))});
  return reply;
}

PairingResult PairingService::Conclude(PairingSession& session) {
  PairingResult result;

  switch (session.Await()) {
    case AwaitOutcome::kConfirmed:
      result = Enroll(session);
      break;
    case AwaitOutcome::kOperatorBlocked: {
      std::lock_guard lock(mutex_);
      blocked_hosts_.insert(PeerHost(session.Peer()));
    }
      [[fallthrough]];
    case AwaitOutcome::kOperatorRejected:
      session.Finish(SessionState::kRejected);
      result = MakeResult(PAIRING_OUTCOME_REJECTED_BY_OPERATOR, "the operator rejected the pairing request");
      break;
    case AwaitOutcome::kClientRejected:
      session.Finish(SessionState::kRejected);
      result = MakeResult(PAIRING_OUTCOME_REJECTED_BY_CLIENT, "the client reported a code mismatch");
      break;
    case AwaitOutcome::kTimedOut:
      session.Finish(SessionState::kTimedOut);
      result = MakeResult(PAIRING_OUTCOME_TIMED_OUT, "confirmation was not given in time");
      break;
    case AwaitOutcome::kClientGone:
    case AwaitOutcome::kAborted:
      session.Finish(SessionState::kAborted);
      result = MakeResult(PAIRING_OUTCOME_ABORTED, "pairing was aborted");
      break;
  }

  MPRISRELAY_LOG_INFO("Pairing concluded", {observability::StringField("session", session.Id()),
                                            observability::StringField("peer", session.Peer()),
                                            observability::StringField("outcome", OutcomeName(result.outcome())),
                                            observability::StringField("identity", result.identity())});
  NotifyOutcome(session, result);
  return result;
}

PairingResult PairingService::Enroll(PairingSession& session) {
  auto confirmation = session.ClientConfirmation();
  if (!confirmation || !confirmation->has_enrollment()) {
    session.Finish(SessionState::kRejected);
    return MakeResult(PAIRING_OUTCOME_CODE_MISMATCH, "confirmation carried no enrollment");
  }

  const auto& box = confirmation->enrollment();
  crypto::Sealed sealed;
  sealed.nonce      = crypto::Bytes(box.nonce().begin(), box.nonce().end());
  sealed.ciphertext = crypto::Bytes(box.ciphertext().begin(), box.ciphertext().end());
  sealed.tag        = crypto::Bytes(box.tag().begin(), box.tag().end());

  // A different shared secret on the client side (MITM, wrong peer)
  // surfaces here as an authentication failure.
  Enrollment enrollment;
  try {
    auto key   = session.EnrollmentKey();
    auto plain = crypto::Open(key.view(), sealed, crypto::AsBytes(session.Id()));
    if (!enrollment.ParseFromArray(plain.view().data(), static_cast<int>(plain.size()))) {
      throw crypto::CryptoError("malformed enrollment");
    }
  } catch (const crypto::CryptoError& e) {
    session.Finish(SessionState::kRejected);
    MPRISRELAY_LOG_WARN("Enrollment rejected", {observability::StringField("session", session.Id()),
                                                observability::StringField("error", e.what())});
    return MakeResult(PAIRING_OUTCOME_CODE_MISMATCH, "the enrollment could not be verified");
  }

  const auto identity_pub = crypto::AsBytes(enrollment.identity_public_key());
  const auto transcript =
      pairing::EnrollmentTranscript(session.Id(), session.RemotePublicKey(), session.LocalPublicKey());
  bool signature_ok = false;
  try {
    signature_ok = crypto::Ed25519Verify(identity_pub, transcript, crypto::AsBytes(enrollment.signature()));
  } catch (const crypto::CryptoError& e) {
    MPRISRELAY_LOG_WARN("Identity key rejected", {observability::StringField("session", session.Id()),
                                                  observability::StringField("error", e.what())});
  }
  if (!signature_ok) {
    session.Finish(SessionState::kRejected);
    return MakeResult(PAIRING_OUTCOME_CODE_MISMATCH, "the identity signature is invalid");
  }

  const auto identity  = pairing::IdentityFromPublicKey(identity_pub);
  auto       trust_key = session.TrustKey(identity_pub);

  std::string client_name = enrollment.client_name();
  if (client_name.empty()) {
    std::lock_guard lock(mutex_);
    client_name = client_names_[session.Id()];
  }

  credentials::TrustMaterial material;
  material.public_key  = crypto::Bytes(identity_pub.begin(), identity_pub.end());
  material.trust_key   = trust_key.copy();
  material.client_name = client_name.substr(0, kMaxClientNameSize);

  try {
    store_->Put(identity, std::move(material));
  } catch (const std::exception& e) {
    session.Finish(SessionState::kAborted);
    MPRISRELAY_LOG_ERROR("Failed to persist trust record", {observability::StringField("session", session.Id()),
                                                            observability::StringField("error", e.what())});
    return MakeResult(PAIRING_OUTCOME_ABORTED, "the agent could not store the pairing");
  }

  PairingResult result = MakeResult(PAIRING_OUTCOME_ESTABLISHED, "paired");
  result.set_identity(identity);
  result.set_key_confirmation(crypto::ToString(pairing::KeyConfirmation(trust_key.view(), identity)));
  session.Finish(SessionState::kEstablished);
  return result;
}

void PairingService::Close(const std::shared_ptr<PairingSession>& session) {
  if (!session) return;

  if (session->Finish(SessionState::kAborted)) {
    MPRISRELAY_LOG_INFO("Pairing session aborted", {observability::StringField("session", session->Id())});
  }
  confirmer_->Withdraw(session->Id());

  std::lock_guard lock(mutex_);
  sessions_.erase(session->Id());
  client_names_.erase(session->Id());
}

std::size_t PairingService::ActiveSessions() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

bool PairingService::IsBlocked(const std::string& peer) const {
  std::lock_guard lock(mutex_);
  return blocked_hosts_.contains(PeerHost(peer));
}

void PairingService::ReapLoop() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    reaper_cv_.wait_for(lock, kReapInterval, [&] { return stopping_; });
    if (stopping_) break;

    std::vector<std::shared_ptr<PairingSession>> open;
    for (auto& [_, session] : sessions_) open.push_back(session);

    lock.unlock();
    const auto now = PairingSession::Clock::now();
    for (auto& session : open) {
      if (session->ExpireIfDue(now)) {
        MPRISRELAY_LOG_INFO("Pairing session timed out", {observability::StringField("session", session->Id())});
        confirmer_->Withdraw(session->Id());
      }
    }
    lock.lock();
  }
}

void PairingService::NotifyOutcome(const PairingSession& session, const PairingResult& result) {
  confirmer_->Withdraw(session.Id());
  if (!notifier_) return;

  if (result.outcome() == PAIRING_OUTCOME_ESTABLISHED) {
    notifier_->Notify("Pairing complete", "A new client can now control media players.");
  } else {
    notifier_->Notify("Pairing failed", result.detail());
  }
}

} // namespace mprisrelay::service
