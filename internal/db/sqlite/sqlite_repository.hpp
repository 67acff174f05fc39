#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mprisrelay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Idempotent; creates the tables this repository needs.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result UpsertTrust(Transaction&, const model::TrustRecord&) override;
  std::optional<model::TrustRecord> GetTrust(Transaction&, const std::string&) override;
  std::vector<model::TrustRecord> ListTrust(Transaction&) override;
  Result DeleteTrust(Transaction&, const std::string&) override;
  std::size_t DeleteAllTrust(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace mprisrelay::db::sqlite
