#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/bus/bus.hpp"
#include "internal/pairing/confirmer.hpp"
#include "internal/util/blocking_queue.hpp"

namespace mprisrelay::pairing {

/*
  DesktopConfirmer

  Asks through an actionable desktop notification with Accept, Reject and
  Block buttons. Dismissing or expiring the notification rejects.

  Notify calls run on a private worker so Prompt() returns immediately;
  answers arrive as bus signals.
*/
class DesktopConfirmer final : public Confirmer {
 public:
  explicit DesktopConfirmer(std::shared_ptr<bus::Bus> bus);
  ~DesktopConfirmer() override;

  // Throws bus::BusError when the signals cannot be subscribed.
  void Start();
  void Stop();

  void Prompt(const PairingPrompt& prompt, DecisionCallback decide) override;
  void Withdraw(const std::string& session_id) override;

 private:
  struct Pending {
    std::string      session_id;
    DecisionCallback decide;
  };

  struct Request {
    PairingPrompt    prompt;
    DecisionCallback decide;
  };

  void Run();
  void Post(const Request& request);
  void OnAction(std::uint32_t id, const std::string& action);
  void OnClosed(std::uint32_t id);

  std::shared_ptr<bus::Bus> bus_;

  util::BlockingQueue<Request> requests_;
  std::thread                  worker_;

  std::mutex                                       mutex_;
  std::unordered_map<std::uint32_t, Pending>       pending_;
  std::unordered_map<std::string, std::uint32_t>   by_session_;
  std::vector<bus::Bus::SubscriptionId>            subscriptions_;
};

} // namespace mprisrelay::pairing
