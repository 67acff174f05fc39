#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mprisrelay::db::model {

/*
  Persistent trust row, one per paired client.

  IMPORTANT:
  - identity is derived from public_key and is the primary key.
  - trust_key is the only secret that survives a pairing session.
  - Never mutated after creation; re-pairing replaces the row.
*/

struct TrustRecord {
  std::string identity;

  // Ed25519 public key of the client's long-term identity
  std::vector<std::uint8_t> public_key;

  // HKDF-derived token used to prove possession on every relay call
  std::vector<std::uint8_t> trust_key;

  std::string client_name;

  int64_t created_at_ms = 0;
};

} // namespace mprisrelay::db::model
