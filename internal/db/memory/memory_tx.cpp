#include "memory_tx.hpp"

#include <stdexcept>

namespace mprisrelay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  base_         = repo_.committed_;
  base_version_ = repo_.committed_version_;
  if (mode_ == TxMode::kWrite) {
    working_ = *base_;
  }
}

MemoryRepository::State* MemoryTransaction::Mutable() {
  return working_ ? &*working_ : nullptr;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *base_;
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::logic_error("trust store transaction already finished");
  }
  if (mode_ == TxMode::kRead) {
    committed_ = true;
    return;
  }
  if (!working_) {
    throw std::logic_error("trust store transaction was rolled back");
  }

  std::shared_ptr<const MemoryRepository::State> next = std::make_shared<MemoryRepository::State>(std::move(*working_));
  working_.reset();

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("trust store write conflict: another writer committed first");
  }
  repo_.committed_ = std::move(next);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
}

} // namespace mprisrelay::db::memory
