#include "internal/pairing/desktop_confirmer.hpp"

#include "internal/notify/desktop_notifier.hpp"
#include "internal/observability/logging.hpp"

namespace mprisrelay::pairing {

namespace {

constexpr auto kNotifyTimeout = std::chrono::milliseconds(1500);

} // namespace

DesktopConfirmer::DesktopConfirmer(std::shared_ptr<bus::Bus> bus) : bus_(std::move(bus)) {
}

DesktopConfirmer::~DesktopConfirmer() {
  Stop();
}

void DesktopConfirmer::Start() {
  bus::SignalMatch action;
  action.interface = notify::kNotificationsInterface;
  action.path      = notify::kNotificationsPath;
  action.member    = "ActionInvoked";

  bus::SignalMatch closed = action;
  closed.member           = "NotificationClosed";

  subscriptions_.push_back(bus_->Subscribe(action, [this](const bus::Signal& signal) {
    if (signal.args.size() < 2) return;
    auto id  = bus::AsInt64(signal.args[0]);
    auto key = bus::AsString(signal.args[1]);
    if (id && key) OnAction(static_cast<std::uint32_t>(*id), *key);
  }));
  subscriptions_.push_back(bus_->Subscribe(closed, [this](const bus::Signal& signal) {
    if (signal.args.empty()) return;
    if (auto id = bus::AsInt64(signal.args[0])) OnClosed(static_cast<std::uint32_t>(*id));
  }));

  worker_ = std::thread(&DesktopConfirmer::Run, this);
}

void DesktopConfirmer::Stop() {
  requests_.Shutdown();
  if (worker_.joinable()) worker_.join();

  for (auto id : subscriptions_) bus_->Unsubscribe(id);
  subscriptions_.clear();

  std::vector<DecisionCallback> abandoned;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, pending] : pending_) abandoned.push_back(std::move(pending.decide));
    pending_.clear();
    by_session_.clear();
  }
  for (auto& decide : abandoned) decide(OperatorDecision::kReject);
}

void DesktopConfirmer::Prompt(const PairingPrompt& prompt, DecisionCallback decide) {
  if (!requests_.TryEnqueue(Request{prompt, decide})) {
    decide(OperatorDecision::kReject);
  }
}

void DesktopConfirmer::Run() {
  while (auto request = requests_.Dequeue()) {
    Post(*request);
  }
}

void DesktopConfirmer::Post(const Request& request) {
  const auto& prompt = request.prompt;

  std::string body = "Code " + prompt.sas + " from " + prompt.peer;
  if (!prompt.client_name.empty()) body += " (" + prompt.client_name + ")";
  body += ". Accept only if the other device shows the same code.";

  auto call = notify::BuildNotification("Pair new device?", body,
                                        {"accept", "Accept", "reject", "Reject", "block", "Block"},
                                        std::chrono::duration_cast<std::chrono::milliseconds>(prompt.timeout));

  std::uint32_t id = 0;
  try {
    auto reply = bus_->Call(call, kNotifyTimeout);
    auto value = reply.empty() ? std::nullopt : bus::AsInt64(reply.front());
    if (!value) throw bus::BusError("org.freedesktop.DBus.Error.InvalidArgs", "Notify returned no id");
    id = static_cast<std::uint32_t>(*value);
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_WARN("Pairing notification failed; rejecting",
                        {observability::StringField("session_id", prompt.session_id),
                         observability::StringField("error", e.what())});
    request.decide(OperatorDecision::kReject);
    return;
  }

  std::lock_guard lock(mutex_);
  pending_[id]                   = Pending{prompt.session_id, request.decide};
  by_session_[prompt.session_id] = id;
}

void DesktopConfirmer::OnAction(std::uint32_t id, const std::string& action) {
  DecisionCallback decide;
  {
    std::lock_guard lock(mutex_);
    auto            it = pending_.find(id);
    if (it == pending_.end()) return;
    decide = std::move(it->second.decide);
    by_session_.erase(it->second.session_id);
    pending_.erase(it);
  }

  if (action == "accept") {
    decide(OperatorDecision::kAccept);
  } else if (action == "block") {
    decide(OperatorDecision::kBlock);
  } else {
    decide(OperatorDecision::kReject);
  }
}

void DesktopConfirmer::OnClosed(std::uint32_t id) {
  DecisionCallback decide;
  {
    std::lock_guard lock(mutex_);
    auto            it = pending_.find(id);
    if (it == pending_.end()) return;
    decide = std::move(it->second.decide);
    by_session_.erase(it->second.session_id);
    pending_.erase(it);
  }
  decide(OperatorDecision::kReject);
}

void DesktopConfirmer::Withdraw(const std::string& session_id) {
  std::uint32_t id = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_session_.find(session_id);
    if (it == by_session_.end()) return;
    id = it->second;
    by_session_.erase(it);
    pending_.erase(id);
  }

  try {
    bus_->Send({notify::kNotificationsName, notify::kNotificationsPath, notify::kNotificationsInterface,
                "CloseNotification", {bus::Value(id)}});
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_DEBUG("CloseNotification failed", {observability::StringField("error", e.what())});
  }
}

} // namespace mprisrelay::pairing
