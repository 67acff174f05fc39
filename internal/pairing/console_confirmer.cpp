#include "internal/pairing/console_confirmer.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>

#include "internal/observability/logging.hpp"

namespace mprisrelay::pairing {

namespace {

constexpr int kPollIntervalMs = 200;

std::string Normalize(std::string line) {
  line.erase(std::remove_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); }), line.end());
  std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c) { return std::tolower(c); });
  return line;
}

} // namespace

ConsoleConfirmer::ConsoleConfirmer(int input_fd, std::ostream& out) : input_fd_(input_fd), out_(out) {
}

ConsoleConfirmer::~ConsoleConfirmer() {
  Stop();
}

void ConsoleConfirmer::Start() {
  running_ = true;
  thread_  = std::thread(&ConsoleConfirmer::Run, this);
}

void ConsoleConfirmer::Stop() {
  running_ = false;
  queue_.Shutdown();
  if (thread_.joinable()) thread_.join();
}

void ConsoleConfirmer::Prompt(const PairingPrompt& prompt, DecisionCallback decide) {
  {
    std::lock_guard lock(mutex_);
    outstanding_.insert(prompt.session_id);
  }
  if (!queue_.TryEnqueue(Pending{prompt, decide})) {
    // Not running: fail closed.
    Settle(prompt.session_id);
    decide(OperatorDecision::kReject);
  }
}

void ConsoleConfirmer::Withdraw(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  // Settled prompts have nothing left to cancel.
  if (outstanding_.count(session_id) > 0) withdrawn_.insert(session_id);
}

std::size_t ConsoleConfirmer::Outstanding() const {
  std::lock_guard lock(mutex_);
  return outstanding_.size();
}

bool ConsoleConfirmer::IsWithdrawn(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return withdrawn_.count(session_id) > 0;
}

void ConsoleConfirmer::Settle(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  outstanding_.erase(session_id);
  withdrawn_.erase(session_id);
}

ConsoleConfirmer::ReadStatus ConsoleConfirmer::ReadLine(std::string* line) {
  while (running_) {
    auto newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      *line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      return ReadStatus::kLine;
    }
    if (eof_) return ReadStatus::kEof;

    pollfd pfd{input_fd_, POLLIN, 0};
    int    rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      eof_ = true;
      continue;
    }
    if (rc == 0) continue;

    char    chunk[256];
    ssize_t n = ::read(input_fd_, chunk, sizeof(chunk));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    if (n <= 0) {
      eof_ = true;
      if (!buffer_.empty()) buffer_.push_back('\n');
      continue;
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
  }
  return ReadStatus::kStopped;
}

void ConsoleConfirmer::Run() {
  while (running_) {
    auto pending = queue_.Dequeue();
    if (!pending) break;

    const auto& prompt = pending->prompt;
    if (IsWithdrawn(prompt.session_id)) {
      Settle(prompt.session_id);
      continue;
    }

    bool answered = false;
    while (!answered) {
      out_ << "\nPairing request from " << prompt.peer;
      if (!prompt.client_name.empty()) out_ << " (" << prompt.client_name << ")";
      out_ << "\n  Code: " << prompt.sas << "\n  Confirm only if the other device shows the same code ("
           << prompt.timeout.count() << "s).\n  Accept? [y]es / [n]o / [b]lock: " << std::flush;

      std::string line;
      auto        status = ReadLine(&line);
      if (status != ReadStatus::kLine) {
        // Nobody can answer any more; everything pending fails closed.
        Settle(prompt.session_id);
        pending->decide(OperatorDecision::kReject);
        while (auto rest = queue_.DequeueFor(std::chrono::milliseconds(0))) {
          Settle(rest->prompt.session_id);
          rest->decide(OperatorDecision::kReject);
        }
        if (status == ReadStatus::kEof) {
          MPRISRELAY_LOG_WARN("Console confirmer input closed; rejecting pairing requests");
          queue_.Close();
        }
        return;
      }

      if (IsWithdrawn(prompt.session_id)) {
        out_ << "  Request " << prompt.session_id.substr(0, 8) << " is no longer pending.\n" << std::flush;
        answered = true;
        continue;
      }

      const auto answer = Normalize(line);
      if (answer == "y" || answer == "yes") {
        pending->decide(OperatorDecision::kAccept);
        answered = true;
      } else if (answer == "n" || answer == "no") {
        pending->decide(OperatorDecision::kReject);
        answered = true;
      } else if (answer == "b" || answer == "block") {
        pending->decide(OperatorDecision::kBlock);
        answered = true;
      } else {
        out_ << "  Please answer y, n or b.\n";
      }
    }
    Settle(prompt.session_id);
  }
}

} // namespace mprisrelay::pairing
