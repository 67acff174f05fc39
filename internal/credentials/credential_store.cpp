#include "credential_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mprisrelay::credentials {

CredentialStore::CredentialStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("CredentialStore requires a repository");
  }
}

db::model::TrustRecord CredentialStore::Put(const std::string& identity, TrustMaterial material) {
  if (identity.empty()) {
    throw util::InvalidArgument("trust identity must not be empty");
  }
  if (material.public_key.empty() || material.trust_key.empty()) {
    throw util::InvalidArgument("trust material is incomplete");
  }

  db::model::TrustRecord record;
  record.identity      = identity;
  record.public_key    = std::move(material.public_key);
  record.trust_key     = std::move(material.trust_key);
  record.client_name   = std::move(material.client_name);
  record.created_at_ms = util::ToUnixMillis(util::Now());

  std::lock_guard lock(mutex_);
  auto            tx       = repository_->Begin(db::TxMode::kWrite);
  const bool      replaced = repository_->GetTrust(*tx, identity).has_value();
  db::ThrowIfError(repository_->UpsertTrust(*tx, record), "store trust record");
  tx->Commit();

  MPRISRELAY_LOG_INFO("Trust record stored", {observability::StringField("identity", identity),
                                              observability::StringField("client", record.client_name),
                                              observability::BoolField("replaced", replaced)});
  return record;
}

std::optional<db::model::TrustRecord> CredentialStore::Get(const std::string& identity) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin(db::TxMode::kRead);
  auto            record = repository_->GetTrust(*tx, identity);
  tx->Commit();
  return record;
}

std::vector<db::model::TrustRecord> CredentialStore::List() {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin(db::TxMode::kRead);
  auto            records = repository_->ListTrust(*tx);
  tx->Commit();
  return records;
}

void CredentialStore::Revoke(const std::string& identity) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin(db::TxMode::kWrite);
  db::ThrowIfError(repository_->DeleteTrust(*tx, identity), "revoke " + identity);
  tx->Commit();

  MPRISRELAY_LOG_INFO("Trust record revoked", {observability::StringField("identity", identity)});
}

std::size_t CredentialStore::RevokeAll() {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin(db::TxMode::kWrite);
  auto            count = repository_->DeleteAllTrust(*tx);
  tx->Commit();

  MPRISRELAY_LOG_INFO("All trust records revoked", {observability::IntField("count", static_cast<int64_t>(count))});
  return count;
}

} // namespace mprisrelay::credentials
