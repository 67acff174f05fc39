#include "memory_repository.hpp"

#include <algorithm>
#include <stdexcept>

#include "memory_tx.hpp"

namespace mprisrelay::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<State>()) {}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertTrust(Transaction& t, const model::TrustRecord& r) {
  auto* s = TX(t).Mutable();
  if (!s) return Result::Err(ErrorCode::ReadOnly, "trust");
  if (r.identity.empty()) return Result::Err(ErrorCode::ConstraintViolation, "identity must not be empty");
  s->trust[r.identity] = r;
  return Result::Ok();
}

std::optional<model::TrustRecord> MemoryRepository::GetTrust(Transaction& t, const std::string& identity) {
  const auto& s  = TX(t).View();
  auto        it = s.trust.find(identity);
  if (it == s.trust.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TrustRecord> MemoryRepository::ListTrust(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::TrustRecord> records;
  records.reserve(s.trust.size());
  for (const auto& [_, record] : s.trust) {
    records.push_back(record);
  }
  // Same order as the SQLite backend.
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.identity < b.identity;
  });
  return records;
}

Result MemoryRepository::DeleteTrust(Transaction& t, const std::string& identity) {
  auto* s = TX(t).Mutable();
  if (!s) return Result::Err(ErrorCode::ReadOnly, "trust");
  if (s->trust.erase(identity) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::size_t MemoryRepository::DeleteAllTrust(Transaction& t) {
  auto* s = TX(t).Mutable();
  if (!s) throw std::logic_error("DeleteAllTrust inside a read transaction");
  std::size_t count = s->trust.size();
  s->trust.clear();
  return count;
}

} // namespace mprisrelay::db::memory
