#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/bus/bus.hpp"
#include "mprisrelay/v1/player.pb.h"

namespace mprisrelay::player {

inline constexpr const char* kMprisPrefix     = "org.mpris.MediaPlayer2.";
inline constexpr const char* kMprisPath       = "/org/mpris/MediaPlayer2";
inline constexpr const char* kRootInterface   = "org.mpris.MediaPlayer2";
inline constexpr const char* kPlayerInterface = "org.mpris.MediaPlayer2.Player";

mprisrelay::v1::CommandResult Accepted();
mprisrelay::v1::CommandResult Rejected(mprisrelay::v1::RejectReason reason, std::string detail);

/*
  PlayerFacade

  Adapts one player service on the bus to the canonical Player model.
  The facade owns the player's raw property state and is its only writer:
  the monitor feeds it change notifications, the relay routes commands
  through Execute().

  The base class is the standard behaviour for compliant players.
  Variants for known-deficient players override the protected hooks.

  Thread model: property updates come from the player's worker, commands
  from relay sessions. Commands are serialized; at most one is in flight
  per player.
*/
class PlayerFacade {
 public:
  PlayerFacade(std::shared_ptr<bus::Bus> bus, std::string bus_name, std::string owner);
  virtual ~PlayerFacade() = default;

  PlayerFacade(const PlayerFacade&)            = delete;
  PlayerFacade& operator=(const PlayerFacade&) = delete;

  virtual const char* Kind() const;

  const std::string& BusName() const {
    return bus_name_;
  }
  const std::string& Owner() const {
    return owner_;
  }

  // Reads every property of both MPRIS interfaces, replacing the cached
  // state. Throws bus::BusError; the cached state is untouched then.
  void Probe(std::chrono::milliseconds timeout);

  // Probe() that reports failure instead of throwing. Returns whether
  // the canonical snapshot changed.
  bool Refresh(std::chrono::milliseconds timeout);

  // PropertiesChanged payload. Invalidated properties are dropped and
  // read as absent. Returns whether the canonical snapshot changed.
  virtual bool ApplyChange(const bus::PropertyMap& changed, const std::vector<std::string>& invalidated);

  bool ApplySeeked(std::int64_t position_us);

  // The player could not be read; report it as UNKNOWN and refuse
  // commands with PLAYER_ERROR until a probe succeeds.
  void MarkDegraded();
  bool Degraded() const;

  std::string Identity() const;
  std::string DesktopEntry() const;

  // Canonical state. player_id is left empty for the monitor to fill.
  mprisrelay::v1::Player Snapshot() const;

  // Never throws. Waits up to `busy_timeout` for a command already in
  // flight on this player.
  mprisrelay::v1::CommandResult Execute(const mprisrelay::v1::Command& command,
                                        std::chrono::milliseconds    busy_timeout);

 protected:
  virtual mprisrelay::v1::Capabilities DeriveCapabilities(const bus::PropertyMap& props) const;

  virtual mprisrelay::v1::CommandResult DoStop();
  virtual mprisrelay::v1::CommandResult DoSeek(std::int64_t position_us);
  virtual mprisrelay::v1::CommandResult DoSetRate(double rate);

  // Player-interface method call with the default timeout.
  void CallPlayer(const std::string& member, std::vector<bus::Value> args = {});
  // SetPosition needs the current track id; returns false without one.
  bool SetPosition(std::int64_t position_us);
  // Relative Seek from the cached position.
  void SeekRelative(std::int64_t position_us);

  bus::PropertyMap Properties() const;
  mprisrelay::v1::Capabilities Capabilities() const;

 private:
  mprisrelay::v1::Player BuildSnapshotLocked() const;
  mprisrelay::v1::CommandResult Dispatch(const mprisrelay::v1::Command& command);

  std::shared_ptr<bus::Bus> bus_;
  std::string               bus_name_;
  std::string               owner_;

  mutable std::mutex state_mu_;
  bus::PropertyMap   props_;
  bool               degraded_ = false;

  std::timed_mutex command_mu_;
};

// Field mapping shared with tests and variants.
mprisrelay::v1::PlaybackState ParsePlaybackStatus(const bus::PropertyMap& props);
mprisrelay::v1::TrackMetadata ParseMetadata(const bus::PropertyMap& props);

} // namespace mprisrelay::player
