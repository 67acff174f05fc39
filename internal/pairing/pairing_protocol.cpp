#include "internal/pairing/pairing_protocol.hpp"

#include <stdexcept>

namespace mprisrelay::pairing {

std::string DeriveSas(std::span<const std::uint8_t> shared_secret, std::span<const std::uint8_t> client_ephemeral,
                      std::span<const std::uint8_t> server_ephemeral, unsigned digits) {
  if (digits < kMinSasDigits || digits > kMaxSasDigits) {
    throw std::invalid_argument("SAS digits out of range");
  }

  const auto salt = crypto::Concat({client_ephemeral, server_ephemeral});
  const auto okm  = crypto::HkdfSha256(shared_secret, salt, kSasInfo, 8);

  std::uint64_t value = 0;
  for (auto b : okm.view()) {
    value = (value << 8) | b;
  }

  std::uint64_t modulus = 1;
  for (unsigned i = 0; i < digits; ++i) modulus *= 10;

  std::string code = std::to_string(value % modulus);
  return std::string(digits - code.size(), '0') + code;
}

crypto::SecretBytes DeriveEnrollmentKey(std::span<const std::uint8_t> shared_secret,
                                        std::span<const std::uint8_t> client_ephemeral,
                                        std::span<const std::uint8_t> server_ephemeral) {
  const auto salt = crypto::Concat({client_ephemeral, server_ephemeral});
  return crypto::HkdfSha256(shared_secret, salt, kEnrollmentInfo, crypto::kKeyLength);
}

crypto::SecretBytes DeriveTrustKey(std::span<const std::uint8_t> shared_secret, std::span<const std::uint8_t> client_ephemeral,
                                   std::span<const std::uint8_t> server_ephemeral,
                                   std::span<const std::uint8_t> identity_public_key) {
  const auto salt = crypto::Concat({client_ephemeral, server_ephemeral, identity_public_key});
  return crypto::HkdfSha256(shared_secret, salt, kTrustInfo, crypto::kKeyLength);
}

std::string IdentityFromPublicKey(std::span<const std::uint8_t> identity_public_key) {
  const auto digest = crypto::Sha256(identity_public_key);
  return crypto::ToHex(std::span(digest).first(kIdentityDigestBytes));
}

crypto::Bytes EnrollmentTranscript(std::string_view session_id, std::span<const std::uint8_t> client_ephemeral,
                                   std::span<const std::uint8_t> server_ephemeral) {
  return crypto::Concat({crypto::AsBytes(kTranscriptLabel), crypto::AsBytes(session_id), client_ephemeral, server_ephemeral});
}

crypto::Bytes KeyConfirmation(std::span<const std::uint8_t> trust_key, std::string_view identity) {
  const auto message = crypto::Concat({crypto::AsBytes(kEstablishedLabel), crypto::AsBytes(identity)});
  return crypto::HmacSha256(trust_key, message);
}

} // namespace mprisrelay::pairing
