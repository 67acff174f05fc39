#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <unordered_set>

#include "internal/pairing/confirmer.hpp"
#include "internal/util/blocking_queue.hpp"

namespace mprisrelay::pairing {

/*
  ConsoleConfirmer

  Asks on a terminal, one prompt at a time, in arrival order. Answers are
  read line by line from `input_fd`: y/yes accepts, n/no rejects,
  b/block blocks the peer. End of input rejects everything pending.

  The descriptor is polled so Stop() never hangs on a silent terminal.
*/
class ConsoleConfirmer final : public Confirmer {
 public:
  ConsoleConfirmer(int input_fd, std::ostream& out);
  ~ConsoleConfirmer() override;

  void Start();
  void Stop();

  void Prompt(const PairingPrompt& prompt, DecisionCallback decide) override;
  void Withdraw(const std::string& session_id) override;

  // Prompts queued or on screen.
  std::size_t Outstanding() const;

 private:
  struct Pending {
    PairingPrompt    prompt;
    DecisionCallback decide;
  };

  enum class ReadStatus { kLine, kEof, kStopped };

  void       Run();
  ReadStatus ReadLine(std::string* line);
  bool       IsWithdrawn(const std::string& session_id) const;
  void       Settle(const std::string& session_id);

  int           input_fd_;
  std::ostream& out_;

  util::BlockingQueue<Pending> queue_;

  mutable std::mutex              mutex_;
  std::unordered_set<std::string> outstanding_;
  std::unordered_set<std::string> withdrawn_;
  std::string                     buffer_;
  bool                            eof_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace mprisrelay::pairing
