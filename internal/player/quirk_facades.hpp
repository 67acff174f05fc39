#pragma once

#include "internal/player/player_facade.hpp"

namespace mprisrelay::player {

/*
  Chromium-based browsers: relative Seek is unreliable, so seeking goes
  through SetPosition only, and the advertised rate range cannot be
  changed.
*/
class ChromiumFacade final : public PlayerFacade {
 public:
  using PlayerFacade::PlayerFacade;

  const char* Kind() const override;

 protected:
  mprisrelay::v1::Capabilities  DeriveCapabilities(const bus::PropertyMap& props) const override;
  mprisrelay::v1::CommandResult DoSeek(std::int64_t position_us) override;
};

/*
  VLC does not announce changes to its Can* properties, so every change
  notification is followed by a full re-read.
*/
class VlcFacade final : public PlayerFacade {
 public:
  using PlayerFacade::PlayerFacade;

  const char* Kind() const override;

  bool ApplyChange(const bus::PropertyMap& changed, const std::vector<std::string>& invalidated) override;
};

/*
  Spotify ignores Stop and Rate. Stop becomes pause plus rewind.
*/
class SpotifyFacade final : public PlayerFacade {
 public:
  using PlayerFacade::PlayerFacade;

  const char* Kind() const override;

 protected:
  mprisrelay::v1::Capabilities  DeriveCapabilities(const bus::PropertyMap& props) const override;
  mprisrelay::v1::CommandResult DoStop() override;
};

} // namespace mprisrelay::player
