#include "internal/relay/auth_proof.hpp"

#include "internal/crypto/crypto.hpp"
#include "internal/util/time.hpp"

namespace mprisrelay::relay {

std::string ProofMessage(std::string_view method, std::string_view identity, std::int64_t timestamp_ms,
                         std::string_view nonce) {
  std::string message(kProofLabel);
  message += '\n';
  message += method;
  message += '\n';
  message += identity;
  message += '\n';
  message += std::to_string(timestamp_ms);
  message += '\n';
  message += nonce;
  return message;
}

std::string ComputeProof(std::span<const std::uint8_t> trust_key, std::string_view method, std::string_view identity,
                         std::int64_t timestamp_ms, std::string_view nonce) {
  const auto message = ProofMessage(method, identity, timestamp_ms, nonce);
  return crypto::ToHex(crypto::HmacSha256(trust_key, crypto::AsBytes(message)));
}

AuthProof MakeAuthProof(std::span<const std::uint8_t> trust_key, std::string_view method, std::string identity) {
  AuthProof proof;
  proof.identity     = std::move(identity);
  proof.timestamp_ms = util::ToUnixMillis(util::Now());
  proof.nonce        = crypto::ToHex(crypto::RandomBytes(kNonceBytes));
  proof.proof        = ComputeProof(trust_key, method, proof.identity, proof.timestamp_ms, proof.nonce);
  return proof;
}

} // namespace mprisrelay::relay
