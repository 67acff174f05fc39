#include "internal/monitor/player_monitor.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/player/facade_factory.hpp"

namespace mprisrelay::monitor {

namespace {

constexpr const char* kMprisNamespace = "org.mpris.MediaPlayer2";

std::string ArgString(const bus::Signal& signal, std::size_t index) {
  if (signal.args.size() <= index) return "";
  return bus::AsString(signal.args[index]).value_or("");
}

} // namespace

const char* ToString(MonitorState state) {
  switch (state) {
    case MonitorState::kStarting:
      return "starting";
    case MonitorState::kRunning:
      return "running";
    case MonitorState::kReconnecting:
      return "reconnecting";
    case MonitorState::kUnavailable:
      return "unavailable";
    case MonitorState::kStopped:
      return "stopped";
  }
  return "unknown";
}

PlayerMonitor::PlayerMonitor(BusConnector connect, MonitorOptions options)
    : connect_(std::move(connect)), options_(options) {
}

PlayerMonitor::~PlayerMonitor() {
  Stop();
}

void PlayerMonitor::Start() {
  SetState(MonitorState::kStarting);
  thread_ = std::thread(&PlayerMonitor::ControlLoop, this);
}

void PlayerMonitor::Stop() {
  if (!thread_.joinable()) return;

  ControlEvent stop;
  stop.kind = ControlEvent::Kind::kStop;
  control_.TryEnqueue(std::move(stop));
  thread_.join();
  SetState(MonitorState::kStopped);
}

MonitorState PlayerMonitor::State() const {
  std::lock_guard lock(state_mu_);
  return state_;
}

bool PlayerMonitor::WaitForState(MonitorState state, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_mu_);
  return state_cv_.wait_for(lock, timeout, [&] { return state_ == state; });
}

void PlayerMonitor::SetState(MonitorState state) {
  {
    std::lock_guard lock(state_mu_);
    if (state_ == state) return;
    state_ = state;
  }
  state_cv_.notify_all();
  MPRISRELAY_LOG_INFO("Player monitor state", {observability::StringField("state", ToString(state))});
}

// ------------------------------------------------------------
// Bus lifecycle (control thread)
// ------------------------------------------------------------

void PlayerMonitor::ControlLoop() {
  bool startup = true;

  while (true) {
    if (!ConnectWithRetry(startup)) return;
    startup = false;

    bool lost = false;
    try {
      Attach();
      lost = Serve();
    } catch (const bus::BusError& e) {
      MPRISRELAY_LOG_WARN("Player discovery failed", {observability::StringField("error", e.what())});
      lost = true;
    }

    if (!lost) {
      Detach(true);
      return;
    }
    Detach(false);
    SetState(MonitorState::kReconnecting);
  }
}

bool PlayerMonitor::ConnectWithRetry(bool startup) {
  auto delay = options_.bus_retry;

  for (unsigned attempt = 1;; ++attempt) {
    if (stop_requested_) return false;

    try {
      bus_ = connect_();
      if (bus_) return true;
    } catch (const bus::BusError& e) {
      MPRISRELAY_LOG_WARN("Session bus unreachable", {observability::IntField("attempt", attempt),
                                                      observability::StringField("error", e.what())});
    }

    if (startup && attempt >= options_.bus_connect_attempts) {
      MPRISRELAY_LOG_ERROR("Player monitor disabled; session bus unavailable",
                           {observability::IntField("attempts", attempt)});
      SetState(MonitorState::kUnavailable);
      return false;
    }
    MPRISRELAY_LOG_DEBUG("Retrying session bus",
                         {observability::DurationField(
                             "retry_in", std::chrono::duration_cast<std::chrono::milliseconds>(delay))});
    if (!Pause(delay)) return false;
    if (!startup) delay = std::min(delay * 2, options_.max_reconnect_backoff);
  }
}

bool PlayerMonitor::Pause(std::chrono::milliseconds delay) {
  const auto deadline = std::chrono::steady_clock::now() + delay;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;

    auto event = control_.DequeueFor(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (event && event->kind == ControlEvent::Kind::kStop) {
      stop_requested_ = true;
      return false;
    }
  }
}

void PlayerMonitor::Attach() {
  const auto generation = ++generation_;

  bus_->SetDisconnectHandler([this, generation] {
    ControlEvent event;
    event.kind       = ControlEvent::Kind::kBusLost;
    event.generation = generation;
    control_.TryEnqueue(std::move(event));
  });

  // Subscribe before listing so no appearance falls between the two.
  bus::SignalMatch owners;
  owners.sender         = bus::kBusName;
  owners.path           = bus::kBusPath;
  owners.interface      = bus::kBusInterface;
  owners.member         = "NameOwnerChanged";
  owners.arg0_namespace = kMprisNamespace;
  subscriptions_.push_back(bus_->Subscribe(owners, [this, generation](const bus::Signal& signal) {
    ControlEvent event;
    event.kind       = ControlEvent::Kind::kNameOwnerChanged;
    event.generation = generation;
    event.name       = ArgString(signal, 0);
    event.old_owner  = ArgString(signal, 1);
    event.new_owner  = ArgString(signal, 2);
    control_.TryEnqueue(std::move(event));
  }));

  bus::SignalMatch properties;
  properties.path      = player::kMprisPath;
  properties.interface = bus::kProperties;
  properties.member    = "PropertiesChanged";
  subscriptions_.push_back(bus_->Subscribe(properties, [this, generation](const bus::Signal& signal) {
    ControlEvent event;
    event.kind       = ControlEvent::Kind::kPropertiesChanged;
    event.generation = generation;
    event.sender     = signal.sender;
    event.interface  = ArgString(signal, 0);
    if (signal.args.size() > 1) {
      if (const auto* changed = bus::AsMap(signal.args[1])) event.changed = *changed;
    }
    if (signal.args.size() > 2) {
      event.invalidated = bus::AsStringList(signal.args[2]).value_or(std::vector<std::string>{});
    }
    control_.TryEnqueue(std::move(event));
  }));

  bus::SignalMatch seeked;
  seeked.path      = player::kMprisPath;
  seeked.interface = player::kPlayerInterface;
  seeked.member    = "Seeked";
  subscriptions_.push_back(bus_->Subscribe(seeked, [this, generation](const bus::Signal& signal) {
    if (signal.args.empty()) return;
    ControlEvent event;
    event.kind        = ControlEvent::Kind::kSeeked;
    event.generation  = generation;
    event.sender      = signal.sender;
    event.position_us = bus::AsInt64(signal.args[0]).value_or(0);
    control_.TryEnqueue(std::move(event));
  }));

  for (const auto& name : bus::ListNames(*bus_)) {
    if (!player::IsPlayerBusName(name)) continue;
    try {
      AddPlayer(name, bus::GetNameOwner(*bus_, name));
    } catch (const bus::BusError& e) {
      MPRISRELAY_LOG_DEBUG("Player vanished during discovery", {observability::StringField("bus_name", name),
                                                                 observability::StringField("error", e.what())});
    }
  }

  SetState(MonitorState::kRunning);
}

bool PlayerMonitor::Serve() {
  while (auto event = control_.Dequeue()) {
    if (event->kind == ControlEvent::Kind::kStop) {
      stop_requested_ = true;
      return false;
    }
    if (event->generation != generation_) continue;

    switch (event->kind) {
      case ControlEvent::Kind::kNameOwnerChanged:
        HandleNameOwnerChanged(*event);
        break;
      case ControlEvent::Kind::kPropertiesChanged:
      case ControlEvent::Kind::kSeeked:
        RouteToOwner(*event);
        break;
      case ControlEvent::Kind::kBusLost:
        MPRISRELAY_LOG_WARN("Session bus lost; all players disappear");
        return true;
      case ControlEvent::Kind::kStop:
        break;
    }
  }
  return false;
}

void PlayerMonitor::Detach(bool unsubscribe) {
  RemoveAllPlayers();
  if (!bus_) return;

  bus_->SetDisconnectHandler(nullptr);
  if (unsubscribe && bus_->IsConnected()) {
    for (auto id : subscriptions_) {
      try {
        bus_->Unsubscribe(id);
      } catch (const bus::BusError& e) {
        MPRISRELAY_LOG_DEBUG("Unsubscribe failed", {observability::StringField("error", e.what())});
      }
    }
  }
  subscriptions_.clear();
  bus_.reset();
}

void PlayerMonitor::HandleNameOwnerChanged(const ControlEvent& event) {
  if (!player::IsPlayerBusName(event.name)) return;

  if (!event.old_owner.empty()) RemovePlayer(event.name);
  if (!event.new_owner.empty()) AddPlayer(event.name, event.new_owner);
}

void PlayerMonitor::RouteToOwner(const ControlEvent& event) {
  if (event.kind == ControlEvent::Kind::kPropertiesChanged && event.interface != player::kPlayerInterface &&
      event.interface != player::kRootInterface) {
    return;
  }

  std::lock_guard lock(dispatch_mu_);
  for (const auto& [name, entry] : players_) {
    if (entry->owner != event.sender || entry->removing) continue;
    if (event.kind == ControlEvent::Kind::kSeeked) {
      entry->worker->PostSeeked(event.position_us);
    } else {
      entry->worker->PostChange(event.changed, event.invalidated);
    }
  }
}

// ------------------------------------------------------------
// Player set
// ------------------------------------------------------------

void PlayerMonitor::AddPlayer(const std::string& bus_name, const std::string& owner) {
  bool replace = false;
  {
    std::lock_guard lock(dispatch_mu_);
    auto            it = players_.find(bus_name);
    if (it != players_.end()) {
      if (it->second->owner == owner) return;
      replace = true;
    }
  }
  if (replace) RemovePlayer(bus_name);

  const auto kind = player::SelectFacadeKind(bus_name);

  auto entry      = std::make_shared<Entry>();
  entry->bus_name = bus_name;
  entry->owner    = owner;
  entry->facade   = player::MakeFacade(kind, bus_, bus_name, owner);

  Entry* raw    = entry.get();
  entry->worker = std::make_unique<PlayerWorker>(
      entry->facade, options_.probe, [this, raw] { OnReady(raw); }, [this, raw] { OnChanged(raw); });

  {
    std::lock_guard lock(dispatch_mu_);
    players_[bus_name] = entry;
  }
  entry->worker->Start();

  MPRISRELAY_LOG_DEBUG("Player discovered", {observability::StringField("bus_name", bus_name),
                                             observability::StringField("owner", owner),
                                             observability::StringField("facade", player::ToString(kind))});
}

void PlayerMonitor::RemovePlayer(const std::string& bus_name) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(dispatch_mu_);
    auto            it = players_.find(bus_name);
    if (it == players_.end()) return;
    entry           = it->second;
    entry->removing = true;
  }

  // Outside the lock: the worker may be waiting for it in a callback.
  entry->worker->Stop();

  std::lock_guard lock(dispatch_mu_);
  auto            it = players_.find(bus_name);
  if (it != players_.end() && it->second == entry) players_.erase(it);

  if (entry->announced) {
    mprisrelay::v1::PlayerEvent event;
    event.mutable_disappeared()->set_player_id(entry->last.player_id());
    EmitLocked(event);

    MPRISRELAY_LOG_INFO("Player disappeared", {observability::StringField("player_id", entry->last.player_id()),
                                               observability::StringField("bus_name", bus_name)});
  }
}

void PlayerMonitor::RemoveAllPlayers() {
  std::vector<std::string> names;
  {
    std::lock_guard lock(dispatch_mu_);
    for (const auto& [name, entry] : players_) names.push_back(name);
  }
  for (const auto& name : names) RemovePlayer(name);
}

// ------------------------------------------------------------
// Worker callbacks
// ------------------------------------------------------------

void PlayerMonitor::OnReady(Entry* entry) {
  std::lock_guard lock(dispatch_mu_);
  auto            it = players_.find(entry->bus_name);
  if (it == players_.end() || it->second.get() != entry || entry->removing) return;

  entry->last = entry->facade->Snapshot();
  entry->last.set_player_id(ClaimPlayerIdLocked(*entry));
  entry->announced = true;

  mprisrelay::v1::PlayerEvent appeared;
  *appeared.mutable_appeared()->mutable_player() = entry->last;
  EmitLocked(appeared);

  mprisrelay::v1::PlayerEvent changed;
  *changed.mutable_state_changed()->mutable_player() = entry->last;
  EmitLocked(changed);

  MPRISRELAY_LOG_INFO("Player appeared", {observability::StringField("player_id", entry->last.player_id()),
                                          observability::StringField("bus_name", entry->bus_name),
                                          observability::StringField("facade", entry->facade->Kind()),
                                          observability::BoolField("degraded", entry->last.degraded())});
}

void PlayerMonitor::OnChanged(Entry* entry) {
  std::lock_guard lock(dispatch_mu_);
  auto            it = players_.find(entry->bus_name);
  if (it == players_.end() || it->second.get() != entry || entry->removing || !entry->announced) return;

  auto snapshot = entry->facade->Snapshot();
  snapshot.set_player_id(entry->last.player_id());
  if (google::protobuf::util::MessageDifferencer::Equals(snapshot, entry->last)) return;
  entry->last = snapshot;

  mprisrelay::v1::PlayerEvent changed;
  *changed.mutable_state_changed()->mutable_player() = entry->last;
  EmitLocked(changed);
}

std::string PlayerMonitor::ClaimPlayerIdLocked(const Entry& entry) const {
  auto base = entry.facade->Identity();
  if (base.empty()) base = entry.facade->DesktopEntry();
  if (base.empty()) base = player::BusNameSuffix(entry.bus_name);

  auto taken = [&](const std::string& id) {
    return std::any_of(players_.begin(), players_.end(), [&](const auto& item) {
      return item.second.get() != &entry && item.second->announced && item.second->last.player_id() == id;
    });
  };

  auto candidate = base;
  for (int n = 2; taken(candidate); ++n) {
    candidate = base + " (" + std::to_string(n) + ")";
  }
  return candidate;
}

void PlayerMonitor::EmitLocked(const mprisrelay::v1::PlayerEvent& event) {
  for (auto* sink : sinks_) {
    sink->OnPlayerEvent(event);
  }
}

// ------------------------------------------------------------
// Consumers
// ------------------------------------------------------------

void PlayerMonitor::AddSink(EventSink* sink) {
  std::lock_guard lock(dispatch_mu_);
  sinks_.push_back(sink);
}

void PlayerMonitor::RemoveSink(EventSink* sink) {
  std::lock_guard lock(dispatch_mu_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

std::vector<mprisrelay::v1::Player> PlayerMonitor::Players() const {
  std::vector<mprisrelay::v1::Player> players;
  WithSnapshot([&](const std::vector<mprisrelay::v1::Player>& current) { players = current; });
  return players;
}

void PlayerMonitor::WithSnapshot(const SnapshotFn& fn) const {
  std::lock_guard                     lock(dispatch_mu_);
  std::vector<mprisrelay::v1::Player> players;
  for (const auto& [name, entry] : players_) {
    if (entry->announced) players.push_back(entry->last);
  }
  fn(players);
}

mprisrelay::v1::CommandResult PlayerMonitor::Execute(const mprisrelay::v1::Command& command,
                                                     std::chrono::milliseconds    busy_timeout) {
  std::shared_ptr<player::PlayerFacade> facade;
  {
    std::lock_guard lock(dispatch_mu_);
    for (const auto& [name, entry] : players_) {
      if (!entry->announced || entry->removing) continue;
      if (entry->last.player_id() == command.player_id() || name == command.player_id()) {
        facade = entry->facade;
        break;
      }
    }
  }

  if (!facade) {
    return player::Rejected(mprisrelay::v1::REJECT_REASON_NOT_FOUND, "no player " + command.player_id());
  }
  return facade->Execute(command, busy_timeout);
}

} // namespace mprisrelay::monitor
