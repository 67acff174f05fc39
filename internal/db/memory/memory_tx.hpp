#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace mprisrelay::db::memory {

/*
  kRead pins the committed state; kWrite works on a private copy that
  Commit() publishes if no other writer committed in between.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);

  TxMode Mode() const override {
    return mode_;
  }
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Null for a kRead transaction.
  MemoryRepository::State* Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  TxMode                                         mode_;
  std::shared_ptr<const MemoryRepository::State> base_;
  std::optional<MemoryRepository::State>         working_;
  uint64_t                                       base_version_ = 0;
  bool                                           committed_    = false;
};

} // namespace mprisrelay::db::memory
