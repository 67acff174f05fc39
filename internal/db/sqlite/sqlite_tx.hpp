#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace mprisrelay::db::sqlite {

/*
  Reads open BEGIN DEFERRED and take no lock until the first SELECT.
  Writes open BEGIN IMMEDIATE so a second agent on the same file fails
  at Begin (after busy_timeout) instead of half way through a re-pair.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  TxMode Mode() const override { return mode_; }
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  std::shared_ptr<SqliteDB> db_;
  TxMode mode_;
  State state_ = State::kOpen;
};

} // namespace mprisrelay::db::sqlite
