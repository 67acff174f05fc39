#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace mprisrelay::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)), mode_(mode) {
  db_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_ERROR("Trust store rollback failed",
                         {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::logic_error("trust store transaction already finished");
  }
  // A failed COMMIT leaves the transaction open; the destructor rolls it back.
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace mprisrelay::db::sqlite
