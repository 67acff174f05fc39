#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/bus/bus.hpp"
#include "internal/player/player_facade.hpp"

namespace mprisrelay::testing {

/*
  In-memory session bus. Players are scripted property bags; signals are
  delivered synchronously on the calling thread.
*/
class FakeBus final : public bus::Bus {
 public:
  struct FakePlayer {
    std::string      owner;
    bus::PropertyMap player_props;
    bus::PropertyMap root_props;
    bool             unresponsive = false;
    // Method calls (other than property reads) fail with this error name.
    std::string fail_methods_with;
    // Play, Pause and Stop update PlaybackStatus and announce it.
    bool follows_transport = false;
  };

  // Registers a player without announcing it; used before the monitor
  // starts so discovery finds it by listing names.
  void Register(const std::string& name, FakePlayer player) {
    std::lock_guard lock(mutex_);
    players_[name] = std::move(player);
  }

  // Registers and emits NameOwnerChanged("", owner).
  void AddPlayer(const std::string& name, FakePlayer player) {
    const auto owner = player.owner;
    Register(name, std::move(player));
    Emit({bus::kBusName, bus::kBusPath, bus::kBusInterface, "NameOwnerChanged",
          {bus::Value(name), bus::Value(""), bus::Value(owner)}});
  }

  void RemovePlayer(const std::string& name) {
    std::string owner;
    {
      std::lock_guard lock(mutex_);
      auto            it = players_.find(name);
      if (it == players_.end()) return;
      owner = it->second.owner;
      players_.erase(it);
    }
    Emit({bus::kBusName, bus::kBusPath, bus::kBusInterface, "NameOwnerChanged",
          {bus::Value(name), bus::Value(owner), bus::Value("")}});
  }

  // Updates the scripted state and emits PropertiesChanged from the owner.
  void ChangeProperties(const std::string& name, const bus::PropertyMap& changed,
                        const std::vector<std::string>& invalidated = {},
                        const std::string&              interface   = player::kPlayerInterface) {
    std::string owner;
    {
      std::lock_guard lock(mutex_);
      auto&           p     = players_.at(name);
      auto&           props = interface == player::kRootInterface ? p.root_props : p.player_props;
      for (const auto& [key, value] : changed) props[key] = value;
      for (const auto& key : invalidated) props.erase(key);
      owner = p.owner;
    }
    Emit({owner, player::kMprisPath, bus::kProperties, "PropertiesChanged",
          {bus::Value(interface), bus::Value(changed), bus::Value(bus::StringList(invalidated))}});
  }

  void EmitSeeked(const std::string& name, std::int64_t position_us) {
    std::string owner;
    {
      std::lock_guard lock(mutex_);
      owner = players_.at(name).owner;
    }
    Emit({owner, player::kMprisPath, player::kPlayerInterface, "Seeked", {bus::Value(position_us)}});
  }

  void SetUnresponsive(const std::string& name, bool unresponsive) {
    std::lock_guard lock(mutex_);
    players_.at(name).unresponsive = unresponsive;
  }

  void FailMethods(const std::string& name, const std::string& error_name) {
    std::lock_guard lock(mutex_);
    players_.at(name).fail_methods_with = error_name;
  }

  // Simulates the bus connection dropping.
  void Disconnect() {
    std::function<void()> handler;
    {
      std::lock_guard lock(mutex_);
      connected_ = false;
      handler    = disconnect_handler_;
    }
    if (handler) handler();
  }

  void Emit(const bus::Signal& signal) {
    std::vector<SignalHandler> handlers;
    {
      std::lock_guard lock(mutex_);
      if (!connected_) return;
      for (const auto& [id, sub] : subscriptions_) {
        if (bus::Matches(sub.first, signal)) handlers.push_back(sub.second);
      }
    }
    for (const auto& handler : handlers) handler(signal);
  }

  std::vector<bus::MethodCall> Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  // Calls to `member` on the player interface of `name`.
  std::vector<bus::MethodCall> PlayerCalls(const std::string& name, const std::string& member) const {
    std::lock_guard              lock(mutex_);
    std::vector<bus::MethodCall> out;
    for (const auto& call : calls_) {
      if (call.destination == name && call.interface == player::kPlayerInterface && call.member == member) {
        out.push_back(call);
      }
    }
    return out;
  }

  std::vector<bus::MethodCall> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::size_t SubscriptionCount() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
  }

  // ------------------------------------------------------------
  // bus::Bus
  // ------------------------------------------------------------

  std::vector<bus::Value> Call(const bus::MethodCall& call, std::chrono::milliseconds) override {
    std::optional<bus::Signal> announce;
    auto                       reply = Answer(call, announce);
    if (announce) Emit(*announce);
    return reply;
  }

  void Send(const bus::MethodCall& call) override {
    std::lock_guard lock(mutex_);
    sent_.push_back(call);
  }

  SubscriptionId Subscribe(const bus::SignalMatch& match, SignalHandler handler) override {
    std::lock_guard lock(mutex_);
    const auto      id = ++next_id_;
    subscriptions_.emplace(id, std::make_pair(match, std::move(handler)));
    return id;
  }

  void Unsubscribe(SubscriptionId id) override {
    std::lock_guard lock(mutex_);
    subscriptions_.erase(id);
  }

  void SetDisconnectHandler(std::function<void()> handler) override {
    std::lock_guard lock(mutex_);
    disconnect_handler_ = std::move(handler);
  }

  bool IsConnected() const override {
    std::lock_guard lock(mutex_);
    return connected_;
  }

 private:
  std::vector<bus::Value> Answer(const bus::MethodCall& call, std::optional<bus::Signal>& announce) {
    std::lock_guard lock(mutex_);
    if (!connected_) throw bus::BusError("org.freedesktop.DBus.Error.Disconnected", "not connected");

    if (call.destination == bus::kBusName) {
      if (call.member == "ListNames") {
        bus::StringList names{bus::kBusName};
        for (const auto& [name, _] : players_) names.push_back(name);
        return {bus::Value(names)};
      }
      if (call.member == "GetNameOwner") {
        const auto name = bus::AsString(call.args.at(0)).value_or("");
        auto       it   = players_.find(name);
        if (it == players_.end()) throw bus::BusError("org.freedesktop.DBus.Error.NameHasNoOwner", name);
        return {bus::Value(it->second.owner)};
      }
      throw bus::BusError("org.freedesktop.DBus.Error.UnknownMethod", call.member);
    }

    auto it = players_.find(call.destination);
    if (it == players_.end()) throw bus::BusError("org.freedesktop.DBus.Error.ServiceUnknown", call.destination);
    auto& p = it->second;
    if (p.unresponsive) throw bus::BusError("org.freedesktop.DBus.Error.NoReply", "no reply");

    calls_.push_back(call);

    if (call.interface == bus::kProperties && call.member == "GetAll") {
      const auto iface = bus::AsString(call.args.at(0)).value_or("");
      return {bus::Value(iface == player::kRootInterface ? p.root_props : p.player_props)};
    }
    if (!p.fail_methods_with.empty()) throw bus::BusError(p.fail_methods_with, call.member + " failed");

    static const std::map<std::string, std::string> kTransport = {
        {"Play", "Playing"}, {"Pause", "Paused"}, {"Stop", "Stopped"}};
    auto next = kTransport.find(call.member);
    if (p.follows_transport && call.interface == player::kPlayerInterface && next != kTransport.end()) {
      p.player_props["PlaybackStatus"] = bus::Value(next->second);
      bus::PropertyMap changed{{"PlaybackStatus", bus::Value(next->second)}};
      announce = bus::Signal{p.owner, player::kMprisPath, bus::kProperties, "PropertiesChanged",
                             {bus::Value(std::string(player::kPlayerInterface)), bus::Value(changed),
                              bus::Value(bus::StringList{})}};
    }
    return {};
  }

  mutable std::mutex                                                         mutex_;
  std::map<std::string, FakePlayer>                                          players_;
  std::map<SubscriptionId, std::pair<bus::SignalMatch, SignalHandler>>       subscriptions_;
  SubscriptionId                                                             next_id_ = 0;
  std::function<void()>                                                      disconnect_handler_;
  bool                                                                       connected_ = true;
  std::vector<bus::MethodCall>                                               calls_;
  std::vector<bus::MethodCall>                                               sent_;
};

// A well-behaved player with full control.
inline FakeBus::FakePlayer StandardPlayer(const std::string& owner, const std::string& identity,
                                          const std::string& status = "Playing") {
  FakeBus::FakePlayer p;
  p.owner = owner;
  p.player_props = {
      {"PlaybackStatus", bus::Value(status)},
      {"CanControl", bus::Value(true)},
      {"CanPlay", bus::Value(true)},
      {"CanPause", bus::Value(true)},
      {"CanGoNext", bus::Value(true)},
      {"CanGoPrevious", bus::Value(true)},
      {"CanSeek", bus::Value(true)},
      {"Rate", bus::Value(1.0)},
      {"MinimumRate", bus::Value(0.5)},
      {"MaximumRate", bus::Value(2.0)},
      {"Position", bus::Value(std::int64_t{1'000'000})},
      {"Metadata", bus::Value(bus::PropertyMap{
                       {"mpris:trackid", bus::Value(bus::ObjectPath{"/org/mpris/MediaPlayer2/Track/1"})},
                       {"xesam:title", bus::Value("Song")},
                       {"xesam:artist", bus::Value(bus::StringList{"Artist"})},
                       {"mpris:length", bus::Value(std::int64_t{180'000'000})},
                   })},
  };
  p.root_props = {{"Identity", bus::Value(identity)}};
  return p;
}

} // namespace mprisrelay::testing
