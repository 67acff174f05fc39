#include "internal/player/player_facade.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "internal/player/facade_factory.hpp"
#include "support/fake_bus.hpp"

namespace {

using namespace std::chrono_literals;
using mprisrelay::player::FacadeKind;
using mprisrelay::player::MakeFacade;
using mprisrelay::player::PlayerFacade;
using mprisrelay::testing::FakeBus;
using mprisrelay::testing::StandardPlayer;
namespace bus = mprisrelay::bus;
namespace v1  = mprisrelay::v1;

constexpr const char* kVlc      = "org.mpris.MediaPlayer2.vlc";
constexpr const char* kChromium = "org.mpris.MediaPlayer2.chromium.instance4242";
constexpr const char* kSpotify  = "org.mpris.MediaPlayer2.spotify";

v1::Command Play() {
  v1::Command cmd;
  cmd.set_play(true);
  return cmd;
}

v1::Command Stop() {
  v1::Command cmd;
  cmd.set_stop(true);
  return cmd;
}

v1::Command SeekTo(std::int64_t position_us) {
  v1::Command cmd;
  cmd.mutable_seek()->set_position_us(position_us);
  return cmd;
}

v1::Command Rate(double rate) {
  v1::Command cmd;
  cmd.mutable_set_rate()->set_rate(rate);
  return cmd;
}

std::unique_ptr<PlayerFacade> Probed(const std::shared_ptr<FakeBus>& fake, const std::string& name,
                                     FakeBus::FakePlayer player) {
  const auto owner = player.owner;
  fake->Register(name, std::move(player));
  auto facade = MakeFacade(mprisrelay::player::SelectFacadeKind(name), fake, name, owner);
  facade->Probe(1s);
  return facade;
}

/*
  Forwards to a FakeBus but holds any call to `gated_member` until
  Release().
*/
class GatedBus final : public bus::Bus {
 public:
  GatedBus(std::shared_ptr<FakeBus> inner, std::string gated_member)
      : inner_(std::move(inner)), gated_member_(std::move(gated_member)) {
  }

  std::vector<bus::Value> Call(const bus::MethodCall& call, std::chrono::milliseconds timeout) override {
    if (call.member == gated_member_) {
      std::unique_lock lock(mu_);
      entered_ = true;
      cv_.notify_all();
      cv_.wait(lock, [&] { return released_; });
    }
    return inner_->Call(call, timeout);
  }
  void Send(const bus::MethodCall& call) override {
    inner_->Send(call);
  }
  SubscriptionId Subscribe(const bus::SignalMatch& match, SignalHandler handler) override {
    return inner_->Subscribe(match, std::move(handler));
  }
  void Unsubscribe(SubscriptionId id) override {
    inner_->Unsubscribe(id);
  }
  void SetDisconnectHandler(std::function<void()> handler) override {
    inner_->SetDisconnectHandler(std::move(handler));
  }
  bool IsConnected() const override {
    return inner_->IsConnected();
  }

  void WaitEntered() {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [&] { return entered_; });
  }
  void Release() {
    std::lock_guard lock(mu_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::shared_ptr<FakeBus> inner_;
  std::string              gated_member_;
  std::mutex               mu_;
  std::condition_variable  cv_;
  bool                     entered_  = false;
  bool                     released_ = false;
};

void TestFacadeSelection() {
  using mprisrelay::player::SelectFacadeKind;
  assert(SelectFacadeKind(kChromium) == FacadeKind::kChromium);
  assert(SelectFacadeKind("org.mpris.MediaPlayer2.Brave.instance1") == FacadeKind::kChromium);
  assert(SelectFacadeKind(kVlc) == FacadeKind::kVlc);
  assert(SelectFacadeKind(kSpotify) == FacadeKind::kSpotify);
  assert(SelectFacadeKind("org.mpris.MediaPlayer2.mpv") == FacadeKind::kStandard);
  assert(SelectFacadeKind("org.mpris.MediaPlayer2.vlcish") == FacadeKind::kStandard);

  assert(mprisrelay::player::IsPlayerBusName(kVlc));
  assert(!mprisrelay::player::IsPlayerBusName("org.mpris.MediaPlayer2."));
  assert(!mprisrelay::player::IsPlayerBusName("org.freedesktop.Notifications"));
  assert(mprisrelay::player::BusNameSuffix("org.mpris.MediaPlayer2.vlc.instance7") == "vlc.instance7");

  auto fake = std::make_shared<FakeBus>();
  assert(std::string(MakeFacade(FacadeKind::kSpotify, fake, kSpotify, ":1.1")->Kind()) == "spotify");
  assert(std::string(MakeFacade(FacadeKind::kStandard, fake, kVlc, ":1.1")->Kind()) == "standard");
}

void TestSnapshotMapping() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  auto snap = facade->Snapshot();
  assert(snap.player_id().empty());
  assert(snap.bus_name() == "org.mpris.MediaPlayer2.mpv");
  assert(snap.facade() == "standard");
  assert(snap.state() == v1::PLAYBACK_STATE_PLAYING);
  assert(snap.metadata().title() == "Song");
  assert(snap.metadata().artist() == "Artist");
  assert(snap.metadata().length_us() == 180'000'000);
  assert(snap.metadata().track_id() == "/org/mpris/MediaPlayer2/Track/1");
  assert(snap.position_us() == 1'000'000);
  assert(snap.rate() == 1.0);
  assert(snap.capabilities().play() && snap.capabilities().seek() && snap.capabilities().set_rate());
  assert(!snap.degraded());
  assert(facade->Identity() == "mpv");
}

void TestMissingAndOddProperties() {
  FakeBus::FakePlayer bare;
  bare.owner        = ":1.8";
  bare.player_props = {{"PlaybackStatus", bus::Value("Buffering")},
                       {"Metadata", bus::Value(bus::PropertyMap{
                                        {"xesam:artist", bus::Value(bus::StringList{"A", "B"})},
                                        {"mpris:length", bus::Value(std::uint64_t{5})},
                                    })}};

  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.bare", bare);
  auto snap   = facade->Snapshot();
  assert(snap.state() == v1::PLAYBACK_STATE_UNKNOWN);
  assert(snap.metadata().artist() == "A, B");
  assert(snap.metadata().length_us() == 5);
  assert(snap.rate() == 1.0);
  // Without CanControl nothing is controllable.
  assert(!snap.capabilities().play() && !snap.capabilities().stop() && !snap.capabilities().seek());

  auto result = facade->Execute(Play(), 100ms);
  assert(!result.accepted());
  assert(result.reason() == v1::REJECT_REASON_UNSUPPORTED);
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.bare", "Play").empty());
}

void TestApplyChangeAndInvalidation() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  assert(facade->ApplyChange({{"PlaybackStatus", bus::Value("Paused")}}, {}));
  assert(facade->Snapshot().state() == v1::PLAYBACK_STATE_PAUSED);
  // Same value again is not a change.
  assert(!facade->ApplyChange({{"PlaybackStatus", bus::Value("Paused")}}, {}));

  assert(facade->ApplyChange({}, {"Metadata"}));
  assert(facade->Snapshot().metadata().title().empty());

  assert(facade->ApplySeeked(42));
  assert(!facade->ApplySeeked(42));
  assert(facade->Snapshot().position_us() == 42);
}

void TestDegradedAndProbeFailure() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  facade->MarkDegraded();
  auto snap = facade->Snapshot();
  assert(snap.degraded());
  assert(snap.state() == v1::PLAYBACK_STATE_UNKNOWN);

  auto refused = facade->Execute(Play(), 100ms);
  assert(!refused.accepted());
  assert(refused.reason() == v1::REJECT_REASON_PLAYER_ERROR);
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Play").empty());

  fake->SetUnresponsive("org.mpris.MediaPlayer2.mpv", true);
  bool threw = false;
  try {
    facade->Probe(50ms);
  } catch (const bus::BusError&) {
    threw = true;
  }
  assert(threw);
  assert(facade->Degraded());
  assert(!facade->Refresh(50ms));

  fake->SetUnresponsive("org.mpris.MediaPlayer2.mpv", false);
  assert(facade->Refresh(50ms));
  assert(!facade->Degraded());
  assert(facade->Snapshot().state() == v1::PLAYBACK_STATE_PLAYING);
  assert(facade->Execute(Play(), 100ms).accepted());
}

void TestBasicCommands() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  assert(facade->Execute(Play(), 100ms).accepted());
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Play").size() == 1);
  assert(facade->Execute(Stop(), 100ms).accepted());
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Stop").size() == 1);

  auto empty = facade->Execute(v1::Command(), 100ms);
  assert(!empty.accepted());
  assert(empty.reason() == v1::REJECT_REASON_INVALID_ARGUMENT);

  fake->FailMethods("org.mpris.MediaPlayer2.mpv", "org.mpris.MediaPlayer2.Player.Error.Failed");
  auto failed = facade->Execute(Play(), 100ms);
  assert(!failed.accepted());
  assert(failed.reason() == v1::REJECT_REASON_PLAYER_ERROR);
}

void TestSeekSemantics() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  auto negative = facade->Execute(SeekTo(-1), 100ms);
  assert(!negative.accepted());
  assert(negative.reason() == v1::REJECT_REASON_INVALID_ARGUMENT);

  assert(facade->Execute(SeekTo(5'000'000), 100ms).accepted());
  auto set = fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "SetPosition");
  assert(set.size() == 1);
  assert(bus::AsString(set[0].args[0]).value() == "/org/mpris/MediaPlayer2/Track/1");
  assert(bus::AsInt64(set[0].args[1]).value() == 5'000'000);

  // Without a track id the seek is relative to the cached position.
  facade->ApplyChange({}, {"Metadata"});
  assert(facade->Execute(SeekTo(3'000'000), 100ms).accepted());
  auto rel = fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Seek");
  assert(rel.size() == 1);
  assert(bus::AsInt64(rel[0].args[0]).value() == 2'000'000);

  facade->ApplyChange({{"CanSeek", bus::Value(false)}}, {});
  auto unsupported = facade->Execute(SeekTo(10), 100ms);
  assert(!unsupported.accepted());
  assert(unsupported.reason() == v1::REJECT_REASON_UNSUPPORTED);

  // Rewinding to zero still works through stop and play.
  assert(facade->Execute(SeekTo(0), 100ms).accepted());
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Stop").size() == 1);
  assert(fake->PlayerCalls("org.mpris.MediaPlayer2.mpv", "Play").size() == 1);
}

void TestRateRange() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, "org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));

  assert(facade->Execute(Rate(1.5), 100ms).accepted());
  auto calls = fake->Calls();
  assert(calls.back().member == "Set");
  assert(bus::AsString(calls.back().args[1]).value() == "Rate");

  for (double bad : {0.0, -1.0, 0.25, 3.0}) {
    auto result = facade->Execute(Rate(bad), 100ms);
    assert(!result.accepted());
    assert(result.reason() == v1::REJECT_REASON_INVALID_ARGUMENT);
  }

  facade->ApplyChange({{"MaximumRate", bus::Value(1.0)}, {"MinimumRate", bus::Value(1.0)}}, {});
  auto fixed = facade->Execute(Rate(1.0), 100ms);
  assert(fixed.reason() == v1::REJECT_REASON_UNSUPPORTED);
}

void TestBusyPlayerRejectsSecondCommand() {
  auto fake  = std::make_shared<FakeBus>();
  fake->Register("org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.3", "mpv"));
  auto gated = std::make_shared<GatedBus>(fake, "Play");

  PlayerFacade facade(gated, "org.mpris.MediaPlayer2.mpv", ":1.3");
  facade.Probe(1s);

  auto first = std::async(std::launch::async, [&] { return facade.Execute(Play(), 100ms); });
  gated->WaitEntered();

  auto second = facade.Execute(Stop(), 50ms);
  assert(!second.accepted());
  assert(second.reason() == v1::REJECT_REASON_PLAYER_BUSY);

  gated->Release();
  assert(first.get().accepted());
  assert(facade.Execute(Stop(), 50ms).accepted());
}

void TestChromiumQuirks() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, kChromium, StandardPlayer(":1.4", "Chromium"));

  auto snap = facade->Snapshot();
  assert(snap.facade() == "chromium");
  assert(!snap.capabilities().set_rate());
  assert(facade->Execute(Rate(1.5), 100ms).reason() == v1::REJECT_REASON_UNSUPPORTED);

  assert(facade->Execute(SeekTo(2'000'000), 100ms).accepted());
  assert(fake->PlayerCalls(kChromium, "SetPosition").size() == 1);

  // No relative fallback without a track.
  facade->ApplyChange({}, {"Metadata"});
  auto result = facade->Execute(SeekTo(2'000'000), 100ms);
  assert(!result.accepted());
  assert(result.reason() == v1::REJECT_REASON_UNSUPPORTED);
  assert(fake->PlayerCalls(kChromium, "Seek").empty());
}

void TestVlcRereadsOnChange() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, kVlc, StandardPlayer(":1.5", "VLC"));
  assert(facade->Snapshot().capabilities().seek());

  // CanSeek flips without a notification; the next change picks it up.
  auto silent                         = StandardPlayer(":1.5", "VLC", "Paused");
  silent.player_props["CanSeek"]      = bus::Value(false);
  fake->Register(kVlc, silent);

  assert(facade->ApplyChange({{"PlaybackStatus", bus::Value("Paused")}}, {}));
  auto snap = facade->Snapshot();
  assert(snap.facade() == "vlc");
  assert(snap.state() == v1::PLAYBACK_STATE_PAUSED);
  assert(!snap.capabilities().seek());
}

void TestSpotifyStopIsPauseAndRewind() {
  auto fake   = std::make_shared<FakeBus>();
  auto facade = Probed(fake, kSpotify, StandardPlayer(":1.6", "Spotify"));

  auto snap = facade->Snapshot();
  assert(snap.capabilities().stop());
  assert(!snap.capabilities().set_rate());

  assert(facade->Execute(Stop(), 100ms).accepted());
  assert(fake->PlayerCalls(kSpotify, "Stop").empty());
  assert(fake->PlayerCalls(kSpotify, "Pause").size() == 1);
  auto set = fake->PlayerCalls(kSpotify, "SetPosition");
  assert(set.size() == 1);
  assert(bus::AsInt64(set[0].args[1]).value() == 0);
}

} // namespace

int main() {
  TestFacadeSelection();
  TestSnapshotMapping();
  TestMissingAndOddProperties();
  TestApplyChangeAndInvalidation();
  TestDegradedAndProbeFailure();
  TestBasicCommands();
  TestSeekSemantics();
  TestRateRange();
  TestBusyPlayerRejectsSecondCommand();
  TestChromiumQuirks();
  TestVlcRereadsOnChange();
  TestSpotifyStopIsPauseAndRewind();

  std::cout << "mprisrelay_unit_player_facade: pass\n";
  return 0;
}
