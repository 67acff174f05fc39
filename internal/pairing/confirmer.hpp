#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace mprisrelay::pairing {

enum class OperatorDecision {
  kAccept,
  kReject,
  // Reject and refuse further attempts from the same peer host.
  kBlock,
};

struct PairingPrompt {
  std::string          session_id;
  std::string          peer;
  std::string          client_name;
  std::string          sas;
  std::chrono::seconds timeout{0};
};

/*
  Confirmer

  Asks the local operator whether the code shown by the remote side
  matches. Prompt() must not block; the decision arrives through the
  callback, on any thread, at most once. A withdrawn prompt may still
  deliver a late decision; the session ignores it.
*/
class Confirmer {
 public:
  using DecisionCallback = std::function<void(OperatorDecision)>;

  virtual ~Confirmer() = default;

  virtual void Prompt(const PairingPrompt& prompt, DecisionCallback decide) = 0;

  virtual void Withdraw(const std::string& session_id) = 0;
};

} // namespace mprisrelay::pairing
