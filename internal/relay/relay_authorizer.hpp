#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/relay/auth_proof.hpp"
#include "internal/util/time.hpp"

namespace mprisrelay::credentials {
class CredentialStore;
}

namespace mprisrelay::relay {

/*
  RelayAuthorizer

  Verifies relay proofs against the credential store. A proof is valid
  once: its nonce is remembered for the length of the skew window, after
  which the timestamp check rejects it anyway.

  Every failure throws util::Unauthenticated with the same message; the
  precise reason is only logged.
*/
class RelayAuthorizer {
 public:
  RelayAuthorizer(std::shared_ptr<credentials::CredentialStore> store, std::chrono::seconds max_skew,
                  util::ClockFn clock = &util::Now);

  // Returns the authenticated identity.
  std::string Authorize(const std::string& method, const AuthProof& proof);

  // False once the identity's trust record is gone.
  bool IsTrusted(const std::string& identity);

  std::size_t CachedNonces() const;

 private:
  [[noreturn]] void Fail(const std::string& identity, const char* reason);
  void              PruneLocked(std::int64_t now_ms);

  std::shared_ptr<credentials::CredentialStore> store_;
  std::chrono::seconds                          max_skew_;
  util::ClockFn                                 clock_;

  mutable std::mutex                            mutex_;
  std::unordered_map<std::string, std::int64_t> nonces_;
};

} // namespace mprisrelay::relay
