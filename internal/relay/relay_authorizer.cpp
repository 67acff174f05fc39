#include "internal/relay/relay_authorizer.hpp"

#include "internal/credentials/credential_store.hpp"
#include "internal/crypto/crypto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::relay {

RelayAuthorizer::RelayAuthorizer(std::shared_ptr<credentials::CredentialStore> store, std::chrono::seconds max_skew,
                                 util::ClockFn clock)
    : store_(std::move(store)), max_skew_(max_skew), clock_(std::move(clock)) {
}

void RelayAuthorizer::Fail(const std::string& identity, const char* reason) {
  MPRISRELAY_LOG_WARN("Relay authentication failed", {observability::StringField("identity", identity),
                                                       observability::StringField("reason", reason)});
  throw util::Unauthenticated("relay authentication failed");
}

std::string RelayAuthorizer::Authorize(const std::string& method, const AuthProof& proof) {
  if (proof.identity.empty() || proof.proof.empty()) Fail(proof.identity, "missing credentials");

  crypto::Bytes nonce;
  try {
    nonce = crypto::FromHex(proof.nonce);
  } catch (const crypto::CryptoError&) {
    Fail(proof.identity, "malformed nonce");
  }
  if (nonce.size() < kNonceBytes) Fail(proof.identity, "nonce too short");

  const auto now_ms = util::ToUnixMillis(clock_());
  const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(max_skew_);
  if (!util::WithinWindow(now_ms, proof.timestamp_ms, window)) Fail(proof.identity, "timestamp outside window");

  auto record = store_->Get(proof.identity);
  if (!record) Fail(proof.identity, "unknown identity");

  const auto expected = ComputeProof(record->trust_key, method, proof.identity, proof.timestamp_ms, proof.nonce);
  if (!crypto::ConstantTimeEquals(crypto::AsBytes(expected), crypto::AsBytes(proof.proof))) {
    Fail(proof.identity, "proof mismatch");
  }

  {
    std::lock_guard lock(mutex_);
    PruneLocked(now_ms);
    const auto key = proof.identity + ":" + proof.nonce;
    if (!nonces_.emplace(key, proof.timestamp_ms + window.count()).second) {
      Fail(proof.identity, "replayed nonce");
    }
  }

  return proof.identity;
}

bool RelayAuthorizer::IsTrusted(const std::string& identity) {
  return store_->Get(identity).has_value();
}

std::size_t RelayAuthorizer::CachedNonces() const {
  std::lock_guard lock(mutex_);
  return nonces_.size();
}

void RelayAuthorizer::PruneLocked(std::int64_t now_ms) {
  for (auto it = nonces_.begin(); it != nonces_.end();) {
    if (it->second < now_ms) {
      it = nonces_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace mprisrelay::relay
