#include "internal/pairing/console_confirmer.hpp"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace {

using mprisrelay::pairing::ConsoleConfirmer;
using mprisrelay::pairing::OperatorDecision;
using mprisrelay::pairing::PairingPrompt;

class Decisions {
 public:
  ConsoleConfirmer::DecisionCallback For(const std::string& session_id) {
    return [this, session_id](OperatorDecision decision) {
      std::lock_guard lock(mutex_);
      decisions_[session_id] = decision;
      cv_.notify_all();
    };
  }

  bool WaitFor(const std::string& session_id, OperatorDecision expected) {
    std::unique_lock lock(mutex_);
    const bool       arrived =
        cv_.wait_for(lock, std::chrono::seconds(5), [&] { return decisions_.count(session_id) > 0; });
    return arrived && decisions_[session_id] == expected;
  }

  bool Has(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    return decisions_.count(session_id) > 0;
  }

 private:
  std::mutex                              mutex_;
  std::condition_variable                 cv_;
  std::map<std::string, OperatorDecision> decisions_;
};

PairingPrompt MakePrompt(const std::string& session_id) {
  PairingPrompt prompt;
  prompt.session_id  = session_id;
  prompt.peer        = "ipv4:10.0.0.7:40000";
  prompt.client_name = "phone";
  prompt.sas         = "4821";
  prompt.timeout     = std::chrono::seconds(60);
  return prompt;
}

void Type(int fd, const std::string& text) {
  const auto written = ::write(fd, text.data(), text.size());
  assert(written == static_cast<ssize_t>(text.size()));
}

bool WaitUntilSettled(const ConsoleConfirmer& confirmer) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (confirmer.Outstanding() != 0) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

void TestAnswersAreReadInOrder() {
  int fds[2];
  assert(::pipe(fds) == 0);

  std::ostringstream out;
  Decisions          decisions;
  ConsoleConfirmer   confirmer(fds[0], out);
  confirmer.Start();

  confirmer.Prompt(MakePrompt("session-a"), decisions.For("session-a"));
  confirmer.Prompt(MakePrompt("session-b"), decisions.For("session-b"));
  confirmer.Prompt(MakePrompt("session-c"), decisions.For("session-c"));

  // An unrecognised answer asks again.
  Type(fds[1], "maybe\n  YES \n");
  assert(decisions.WaitFor("session-a", OperatorDecision::kAccept));

  Type(fds[1], "b\n");
  assert(decisions.WaitFor("session-b", OperatorDecision::kBlock));

  Type(fds[1], "no\n");
  assert(decisions.WaitFor("session-c", OperatorDecision::kReject));

  confirmer.Stop();
  ::close(fds[0]);
  ::close(fds[1]);

  const auto text = out.str();
  assert(text.find("Code: 4821") != std::string::npos);
  assert(text.find("(phone)") != std::string::npos);
  assert(text.find("Please answer y, n or b.") != std::string::npos);
}

void TestWithdrawnPromptIsSkipped() {
  int fds[2];
  assert(::pipe(fds) == 0);

  std::ostringstream out;
  Decisions          decisions;
  ConsoleConfirmer   confirmer(fds[0], out);
  confirmer.Start();

  confirmer.Prompt(MakePrompt("first"), decisions.For("first"));
  confirmer.Prompt(MakePrompt("gone"), decisions.For("gone"));
  confirmer.Withdraw("gone");
  confirmer.Prompt(MakePrompt("last"), decisions.For("last"));

  Type(fds[1], "y\n");
  assert(decisions.WaitFor("first", OperatorDecision::kAccept));
  Type(fds[1], "y\n");
  assert(decisions.WaitFor("last", OperatorDecision::kAccept));
  assert(!decisions.Has("gone"));
  assert(WaitUntilSettled(confirmer));

  confirmer.Stop();
  ::close(fds[0]);
  ::close(fds[1]);
}

void TestWithdrawAfterAnswerLeavesNothingBehind() {
  int fds[2];
  assert(::pipe(fds) == 0);

  std::ostringstream out;
  Decisions          first;
  Decisions          second;
  ConsoleConfirmer   confirmer(fds[0], out);
  confirmer.Start();

  confirmer.Prompt(MakePrompt("reused"), first.For("reused"));
  assert(confirmer.Outstanding() == 1);
  Type(fds[1], "y\n");
  assert(first.WaitFor("reused", OperatorDecision::kAccept));
  assert(WaitUntilSettled(confirmer));

  // Every finished pairing withdraws its prompt.
  confirmer.Withdraw("reused");
  confirmer.Withdraw("never-prompted");
  assert(confirmer.Outstanding() == 0);

  // A later prompt under the same id is still asked.
  confirmer.Prompt(MakePrompt("reused"), second.For("reused"));
  Type(fds[1], "n\n");
  assert(second.WaitFor("reused", OperatorDecision::kReject));
  assert(WaitUntilSettled(confirmer));

  confirmer.Stop();
  ::close(fds[0]);
  ::close(fds[1]);
}

void TestEndOfInputRejectsEverythingPending() {
  int fds[2];
  assert(::pipe(fds) == 0);

  std::ostringstream out;
  Decisions          decisions;
  ConsoleConfirmer   confirmer(fds[0], out);
  confirmer.Start();

  confirmer.Prompt(MakePrompt("one"), decisions.For("one"));
  confirmer.Prompt(MakePrompt("two"), decisions.For("two"));
  ::close(fds[1]);

  assert(decisions.WaitFor("one", OperatorDecision::kReject));
  assert(decisions.WaitFor("two", OperatorDecision::kReject));

  // Later prompts fail closed immediately.
  confirmer.Prompt(MakePrompt("three"), decisions.For("three"));
  assert(decisions.WaitFor("three", OperatorDecision::kReject));

  confirmer.Stop();
  ::close(fds[0]);
}

void TestPromptWithoutStartFailsClosed() {
  std::ostringstream out;
  Decisions          decisions;
  ConsoleConfirmer   confirmer(STDIN_FILENO, out);
  confirmer.Stop();

  confirmer.Prompt(MakePrompt("late"), decisions.For("late"));
  assert(decisions.WaitFor("late", OperatorDecision::kReject));
}

} // namespace

int main() {
  TestAnswersAreReadInOrder();
  TestWithdrawnPromptIsSkipped();
  TestWithdrawAfterAnswerLeavesNothingBehind();
  TestEndOfInputRejectsEverythingPending();
  TestPromptWithoutStartFailsClosed();

  std::cout << "mprisrelay_unit_console_confirmer: pass\n";
  return 0;
}
