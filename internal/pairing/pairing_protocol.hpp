#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "internal/crypto/crypto.hpp"

namespace mprisrelay::pairing {

/*
  Key schedule shared by the agent and by clients.

  shared          = X25519(local eph, remote eph)
  salt            = client_eph || server_eph
  SAS             = HKDF(shared, salt, "mprisrelay/v1 sas")[0..8] mod 10^digits
  enrollment key  = HKDF(shared, salt, "mprisrelay/v1 enrollment")
  trust key       = HKDF(shared, salt || identity_pub, "mprisrelay/v1 trust")
  identity        = hex(SHA-256(identity_pub)[0..16])

  The SAS depends only on the shared secret and both ephemeral keys, in a
  fixed order, so neither side can steer it alone.
*/

inline constexpr std::string_view kSasInfo            = "mprisrelay/v1 sas";
inline constexpr std::string_view kEnrollmentInfo     = "mprisrelay/v1 enrollment";
inline constexpr std::string_view kTrustInfo          = "mprisrelay/v1 trust";
inline constexpr std::string_view kTranscriptLabel    = "mprisrelay/v1 enroll";
inline constexpr std::string_view kEstablishedLabel   = "mprisrelay/v1 established";
inline constexpr unsigned         kMinSasDigits       = 4;
inline constexpr unsigned         kMaxSasDigits       = 8;
inline constexpr std::size_t      kIdentityDigestBytes = 16;

std::string DeriveSas(std::span<const std::uint8_t> shared_secret, std::span<const std::uint8_t> client_ephemeral,
                      std::span<const std::uint8_t> server_ephemeral, unsigned digits);

crypto::SecretBytes DeriveEnrollmentKey(std::span<const std::uint8_t> shared_secret,
                                        std::span<const std::uint8_t> client_ephemeral,
                                        std::span<const std::uint8_t> server_ephemeral);

crypto::SecretBytes DeriveTrustKey(std::span<const std::uint8_t> shared_secret, std::span<const std::uint8_t> client_ephemeral,
                                   std::span<const std::uint8_t> server_ephemeral,
                                   std::span<const std::uint8_t> identity_public_key);

std::string IdentityFromPublicKey(std::span<const std::uint8_t> identity_public_key);

// What the client signs with its long-term key.
crypto::Bytes EnrollmentTranscript(std::string_view session_id, std::span<const std::uint8_t> client_ephemeral,
                                   std::span<const std::uint8_t> server_ephemeral);

crypto::Bytes KeyConfirmation(std::span<const std::uint8_t> trust_key, std::string_view identity);

} // namespace mprisrelay::pairing
