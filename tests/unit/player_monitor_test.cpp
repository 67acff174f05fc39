#include "internal/monitor/player_monitor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "support/fake_bus.hpp"

namespace {

using namespace std::chrono_literals;
using mprisrelay::monitor::MonitorOptions;
using mprisrelay::monitor::MonitorState;
using mprisrelay::monitor::PlayerMonitor;
using mprisrelay::testing::FakeBus;
using mprisrelay::testing::StandardPlayer;
namespace bus = mprisrelay::bus;
namespace v1  = mprisrelay::v1;

class RecordingSink final : public mprisrelay::monitor::EventSink {
 public:
  void OnPlayerEvent(const v1::PlayerEvent& event) override {
    {
      std::lock_guard lock(mu_);
      events_.push_back(event);
    }
    cv_.notify_all();
  }

  bool WaitForCount(std::size_t count, std::chrono::milliseconds timeout = 3s) {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
  }

  std::vector<v1::PlayerEvent> Events() const {
    std::lock_guard lock(mu_);
    return events_;
  }

 private:
  mutable std::mutex           mu_;
  std::condition_variable      cv_;
  std::vector<v1::PlayerEvent> events_;
};

MonitorOptions FastOptions() {
  MonitorOptions options;
  options.probe.attempts     = 2;
  options.probe.backoff      = 10ms;
  options.probe.call_timeout = 100ms;
  options.bus_connect_attempts = 3;
  options.bus_retry            = 10ms;
  options.max_reconnect_backoff = 50ms;
  return options;
}

PlayerMonitor::BusConnector Connector(std::shared_ptr<FakeBus> fake) {
  return [fake] { return std::static_pointer_cast<bus::Bus>(fake); };
}

void TestStartupDiscoveryOrdersAppearedBeforeState() {
  auto fake = std::make_shared<FakeBus>();
  fake->Register("org.mpris.MediaPlayer2.vlc", StandardPlayer(":1.5", "VLC"));
  fake->Register("org.freedesktop.Notifications", StandardPlayer(":1.2", "not a player"));

  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();

  assert(monitor.WaitForState(MonitorState::kRunning, 3s));
  assert(sink.WaitForCount(2));

  auto events = sink.Events();
  assert(events[0].has_appeared());
  assert(events[0].appeared().player().player_id() == "VLC");
  assert(events[0].appeared().player().facade() == "vlc");
  assert(events[1].has_state_changed());
  assert(events[1].state_changed().player().state() == v1::PLAYBACK_STATE_PLAYING);

  auto players = monitor.Players();
  assert(players.size() == 1);
  assert(players[0].bus_name() == "org.mpris.MediaPlayer2.vlc");

  monitor.Stop();
  assert(monitor.State() == MonitorState::kStopped);
  // Stopping retracts every player.
  events = sink.Events();
  assert(events.back().has_disappeared());
  assert(events.back().disappeared().player_id() == "VLC");
  assert(fake->SubscriptionCount() == 0);
}

void TestRuntimeChangesAndRemoval() {
  auto          fake = std::make_shared<FakeBus>();
  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(monitor.WaitForState(MonitorState::kRunning, 3s));

  fake->AddPlayer("org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.7", "mpv"));
  assert(sink.WaitForCount(2));

  fake->ChangeProperties("org.mpris.MediaPlayer2.mpv", {{"PlaybackStatus", bus::Value("Paused")}});
  assert(sink.WaitForCount(3));
  auto events = sink.Events();
  assert(events[2].has_state_changed());
  assert(events[2].state_changed().player().player_id() == "mpv");
  assert(events[2].state_changed().player().state() == v1::PLAYBACK_STATE_PAUSED);

  fake->EmitSeeked("org.mpris.MediaPlayer2.mpv", 7'000'000);
  assert(sink.WaitForCount(4));
  assert(sink.Events()[3].state_changed().player().position_us() == 7'000'000);

  // Root-interface changes count too; unrelated interfaces do not.
  fake->ChangeProperties("org.mpris.MediaPlayer2.mpv", {{"Foo", bus::Value(true)}}, {}, "org.example.Other");
  fake->ChangeProperties("org.mpris.MediaPlayer2.mpv", {{"PlaybackStatus", bus::Value("Stopped")}});
  assert(sink.WaitForCount(5));
  assert(sink.Events()[4].state_changed().player().state() == v1::PLAYBACK_STATE_STOPPED);

  v1::Command play;
  play.set_player_id("mpv");
  play.set_play(true);
  assert(monitor.Execute(play, 100ms).accepted());
  play.set_player_id("org.mpris.MediaPlayer2.mpv");
  assert(monitor.Execute(play, 100ms).accepted());
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Play").size() == 2);

  fake->RemovePlayer("org.mpris.MediaPlayer2.mpv");
  assert(sink.WaitForCount(6));
  events = sink.Events();
  assert(events[5].has_disappeared());
  assert(events[5].disappeared().player_id() == "mpv");
  assert(monitor.Players().empty());

  play.set_player_id("mpv");
  auto result = monitor.Execute(play, 100ms);
  assert(!result.accepted());
  assert(result.reason() == v1::REJECT_REASON_NOT_FOUND);

  monitor.Stop();
}

void TestDuplicateIdentitiesAreNumbered() {
  auto fake = std::make_shared<FakeBus>();
  fake->Register("org.mpris.MediaPlayer2.mpv.instance1", StandardPlayer(":1.10", "mpv"));
  fake->Register("org.mpris.MediaPlayer2.mpv.instance2", StandardPlayer(":1.11", "mpv"));

  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(sink.WaitForCount(4));

  std::set<std::string> ids;
  for (const auto& player : monitor.Players()) ids.insert(player.player_id());
  assert(ids == (std::set<std::string>{"mpv", "mpv (2)"}));

  monitor.Stop();
}

void TestUnresponsivePlayerIsDegraded() {
  auto fake   = std::make_shared<FakeBus>();
  auto silent = StandardPlayer(":1.12", "hung");
  silent.unresponsive = true;
  fake->Register("org.mpris.MediaPlayer2.hung", silent);

  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(sink.WaitForCount(2));

  auto appeared = sink.Events()[0].appeared().player();
  assert(appeared.degraded());
  assert(appeared.state() == v1::PLAYBACK_STATE_UNKNOWN);
  // Nothing was read, so the id falls back to the bus name.
  assert(appeared.player_id() == "hung");

  monitor.Stop();
}

void TestDegradedPlayerRecoversOnSignal() {
  auto fake   = std::make_shared<FakeBus>();
  auto silent = StandardPlayer(":1.12", "hung", "Paused");
  silent.unresponsive = true;
  fake->Register("org.mpris.MediaPlayer2.hung", silent);

  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(sink.WaitForCount(2));

  v1::Command play;
  play.set_player_id("hung");
  play.set_play(true);
  auto refused = monitor.Execute(play, 100ms);
  assert(!refused.accepted());
  assert(refused.reason() == v1::REJECT_REASON_PLAYER_ERROR);

  std::this_thread::sleep_for(300ms);
  fake->SetUnresponsive("org.mpris.MediaPlayer2.hung", false);
  fake->ChangeProperties("org.mpris.MediaPlayer2.hung", {{"PlaybackStatus", bus::Value("Playing")}});
  assert(sink.WaitForCount(3));

  auto recovered = sink.Events()[2];
  assert(recovered.has_state_changed());
  assert(!recovered.state_changed().player().degraded());
  assert(recovered.state_changed().player().state() == v1::PLAYBACK_STATE_PLAYING);

  auto players = monitor.Players();
  assert(players.size() == 1);
  assert(players[0].player_id() == "hung");
  assert(!players[0].degraded());
  assert(players[0].state() == v1::PLAYBACK_STATE_PLAYING);
  assert(players[0].capabilities().play());

  assert(monitor.Execute(play, 100ms).accepted());
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.hung", "Play").size() == 1);

  monitor.Stop();
}

void TestOwnerChangeReannounces() {
  auto fake = std::make_shared<FakeBus>();
  fake->Register("org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.7", "mpv"));

  RecordingSink sink;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(sink.WaitForCount(2));

  fake->Register("org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.9", "mpv"));
  fake->Emit({bus::kBusName, bus::kBusPath, bus::kBusInterface, "NameOwnerChanged",
              {bus::Value("org.mpris.MediaPlayer2.mpv"), bus::Value(":1.7"), bus::Value(":1.9")}});
  assert(sink.WaitForCount(5));

  auto events = sink.Events();
  assert(events[2].has_disappeared());
  assert(events[3].has_appeared());
  assert(events[3].appeared().player().player_id() == "mpv");
  assert(events[4].has_state_changed());

  monitor.Stop();
}

void TestBusLossRetractsAndReconnects() {
  auto first  = std::make_shared<FakeBus>();
  auto second = std::make_shared<FakeBus>();
  first->Register("org.mpris.MediaPlayer2.vlc", StandardPlayer(":1.5", "VLC"));
  second->Register("org.mpris.MediaPlayer2.vlc", StandardPlayer(":2.5", "VLC", "Paused"));

  std::atomic<int> connects{0};
  auto connector = [&]() -> std::shared_ptr<bus::Bus> {
    return ++connects == 1 ? first : second;
  };

  RecordingSink sink;
  PlayerMonitor monitor(connector, FastOptions());
  monitor.AddSink(&sink);
  monitor.Start();
  assert(sink.WaitForCount(2));

  first->Disconnect();
  assert(sink.WaitForCount(5));

  auto events = sink.Events();
  assert(events[2].has_disappeared());
  assert(events[2].disappeared().player_id() == "VLC");
  assert(events[3].has_appeared());
  assert(events[3].appeared().player().state() == v1::PLAYBACK_STATE_PAUSED);
  assert(events[4].has_state_changed());
  assert(connects == 2);
  assert(monitor.WaitForState(MonitorState::kRunning, 3s));

  // Signals from the dead connection are ignored.
  first->ChangeProperties("org.mpris.MediaPlayer2.vlc", {{"PlaybackStatus", bus::Value("Stopped")}});
  assert(!sink.WaitForCount(6, 200ms));

  monitor.Stop();
}

void TestUnreachableBusLeavesMonitorUnavailable() {
  std::atomic<int> attempts{0};
  auto connector = [&]() -> std::shared_ptr<bus::Bus> {
    ++attempts;
    throw bus::BusError("org.freedesktop.DBus.Error.NoServer", "no session bus");
  };

  PlayerMonitor monitor(connector, FastOptions());
  monitor.Start();
  assert(monitor.WaitForState(MonitorState::kUnavailable, 3s));
  assert(attempts == 3);
  assert(monitor.Players().empty());

  v1::Command play;
  play.set_player_id("anything");
  play.set_play(true);
  assert(monitor.Execute(play, 10ms).reason() == v1::REJECT_REASON_NOT_FOUND);

  monitor.Stop();
  assert(monitor.State() == MonitorState::kStopped);
}

void TestSnapshotIsConsistentWithStream() {
  auto fake = std::make_shared<FakeBus>();
  fake->Register("org.mpris.MediaPlayer2.vlc", StandardPlayer(":1.5", "VLC"));

  RecordingSink early;
  PlayerMonitor monitor(Connector(fake), FastOptions());
  monitor.AddSink(&early);
  monitor.Start();
  assert(early.WaitForCount(2));

  RecordingSink late;
  monitor.AddSink(&late);
  std::vector<v1::Player> snapshot;
  monitor.WithSnapshot([&](const std::vector<v1::Player>& players) { snapshot = players; });
  assert(snapshot.size() == 1);
  assert(snapshot[0].state() == v1::PLAYBACK_STATE_PLAYING);
  // Registered after the announcement; only later changes arrive.
  assert(late.Events().empty());

  fake->ChangeProperties("org.mpris.MediaPlayer2.vlc", {{"PlaybackStatus", bus::Value("Paused")}});
  assert(late.WaitForCount(1));
  assert(late.Events()[0].has_state_changed());
  assert(late.Events()[0].state_changed().player().state() == v1::PLAYBACK_STATE_PAUSED);

  monitor.RemoveSink(&late);
  monitor.Stop();
  assert(late.Events().size() == 1);
}

} // namespace

int main() {
  TestStartupDiscoveryOrdersAppearedBeforeState();
  TestRuntimeChangesAndRemoval();
  TestDuplicateIdentitiesAreNumbered();
  TestUnresponsivePlayerIsDegraded();
  TestDegradedPlayerRecoversOnSignal();
  TestOwnerChangeReannounces();
  TestBusLossRetractsAndReconnects();
  TestUnreachableBusLeavesMonitorUnavailable();
  TestSnapshotIsConsistentWithStream();

  std::cout << "mprisrelay_unit_player_monitor: pass\n";
  return 0;
}
