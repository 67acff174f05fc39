#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mprisrelay::db::memory {

class MemoryTransaction;

// Non-durable backend used by tests and `credentials.in_memory`.
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result UpsertTrust(Transaction&, const model::TrustRecord&) override;
  std::optional<model::TrustRecord> GetTrust(Transaction&, const std::string&) override;
  std::vector<model::TrustRecord> ListTrust(Transaction&) override;
  Result DeleteTrust(Transaction&, const std::string&) override;
  std::size_t DeleteAllTrust(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TrustRecord> trust;
  };

  // Committed states are immutable once published.
  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

} // namespace mprisrelay::db::memory
