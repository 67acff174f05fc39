#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/trust_record.hpp"

namespace mprisrelay::credentials {

// What a successful pairing hands to the store.
struct TrustMaterial {
  std::vector<std::uint8_t> public_key;
  std::vector<std::uint8_t> trust_key;
  std::string               client_name;
};

/*
  CredentialStore

  Durable identity -> trust record mapping. Writers (pairing) and readers
  (relay auth) are serialized here; every operation runs in its own
  repository transaction, so a reader sees either the old record or the
  new one, never a partial write.
*/
class CredentialStore {
 public:
  explicit CredentialStore(std::shared_ptr<db::Repository> repository);

  // Creates the record, replacing any previous record for `identity`.
  db::model::TrustRecord Put(const std::string& identity, TrustMaterial material);

  std::optional<db::model::TrustRecord> Get(const std::string& identity);

  std::vector<db::model::TrustRecord> List();

  // Throws util::NotFound when nothing was paired under `identity`.
  void Revoke(const std::string& identity);

  std::size_t RevokeAll();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::mutex                      mutex_;
};

} // namespace mprisrelay::credentials
