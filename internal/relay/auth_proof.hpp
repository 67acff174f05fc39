#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace mprisrelay::relay {

/*
  Proof of possession presented on every relay call as request metadata:

    x-mprisrelay-identity   paired identity
    x-mprisrelay-timestamp  unix milliseconds
    x-mprisrelay-nonce      random hex, at least 16 bytes
    x-mprisrelay-proof      hex HMAC-SHA256(trust key, message)

  message = "mprisrelay/v1 proof\n" method "\n" identity "\n" timestamp "\n" nonce

  Binding the method name keeps a proof for ListPlayers from opening a
  stream.
*/

inline constexpr const char* kIdentityHeader  = "x-mprisrelay-identity";
inline constexpr const char* kTimestampHeader = "x-mprisrelay-timestamp";
inline constexpr const char* kNonceHeader     = "x-mprisrelay-nonce";
inline constexpr const char* kProofHeader     = "x-mprisrelay-proof";

inline constexpr std::string_view kProofLabel   = "mprisrelay/v1 proof";
inline constexpr std::size_t      kNonceBytes   = 16;
inline constexpr const char*      kConnectMethod     = "/mprisrelay.v1.Relay/Connect";
inline constexpr const char*      kListPlayersMethod = "/mprisrelay.v1.Relay/ListPlayers";

struct AuthProof {
  std::string  identity;
  std::int64_t timestamp_ms = 0;
  std::string  nonce;
  std::string  proof;
};

std::string ProofMessage(std::string_view method, std::string_view identity, std::int64_t timestamp_ms,
                         std::string_view nonce);

std::string ComputeProof(std::span<const std::uint8_t> trust_key, std::string_view method, std::string_view identity,
                         std::int64_t timestamp_ms, std::string_view nonce);

// Fresh nonce, current time.
AuthProof MakeAuthProof(std::span<const std::uint8_t> trust_key, std::string_view method, std::string identity);

} // namespace mprisrelay::relay
