#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/trust_record.hpp"

namespace mprisrelay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a kWrite Transaction
  - Reads inside a write transaction see its writes
  - A record is replaced as a whole; readers never see a mix of the old
    and new row for one identity

  The DB is the source of truth for:
    trust records (paired clients)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  // ---------------------------------------------------------------------
  // Trust records
  // ---------------------------------------------------------------------

  // Write operations return ErrorCode::ReadOnly, or throw std::logic_error
  // where they return no Result, inside a kRead transaction.

  // Inserts, or replaces the existing record with the same identity.
  virtual Result UpsertTrust(Transaction&, const model::TrustRecord&) = 0;

  virtual std::optional<model::TrustRecord> GetTrust(Transaction&, const std::string& identity) = 0;

  virtual std::vector<model::TrustRecord> ListTrust(Transaction&) = 0;

  // NotFound when no record existed.
  virtual Result DeleteTrust(Transaction&, const std::string& identity) = 0;

  // Returns the number of deleted records.
  virtual std::size_t DeleteAllTrust(Transaction&) = 0;
};

} // namespace mprisrelay::db
