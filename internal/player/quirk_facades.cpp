#include "internal/player/quirk_facades.hpp"

namespace mprisrelay::player {

namespace {

constexpr auto kRefreshTimeout = std::chrono::milliseconds(1000);

} // namespace

// ------------------------------------------------------------
// ChromiumFacade
// ------------------------------------------------------------

const char* ChromiumFacade::Kind() const {
  return "chromium";
}

mprisrelay::v1::Capabilities ChromiumFacade::DeriveCapabilities(const bus::PropertyMap& props) const {
  auto caps = PlayerFacade::DeriveCapabilities(props);
  caps.set_set_rate(false);
  return caps;
}

mprisrelay::v1::CommandResult ChromiumFacade::DoSeek(std::int64_t position_us) {
  if (!SetPosition(position_us)) {
    return Rejected(mprisrelay::v1::REJECT_REASON_UNSUPPORTED, "no current track to seek in");
  }
  return Accepted();
}

// ------------------------------------------------------------
// VlcFacade
// ------------------------------------------------------------

const char* VlcFacade::Kind() const {
  return "vlc";
}

bool VlcFacade::ApplyChange(const bus::PropertyMap& changed, const std::vector<std::string>& invalidated) {
  const bool applied   = PlayerFacade::ApplyChange(changed, invalidated);
  const bool refreshed = Refresh(kRefreshTimeout);
  return applied || refreshed;
}

// ------------------------------------------------------------
// SpotifyFacade
// ------------------------------------------------------------

const char* SpotifyFacade::Kind() const {
  return "spotify";
}

mprisrelay::v1::Capabilities SpotifyFacade::DeriveCapabilities(const bus::PropertyMap& props) const {
  auto caps = PlayerFacade::DeriveCapabilities(props);
  caps.set_stop(caps.pause());
  caps.set_set_rate(false);
  return caps;
}

mprisrelay::v1::CommandResult SpotifyFacade::DoStop() {
  CallPlayer("Pause");
  if (!SetPosition(0)) SeekRelative(0);
  return Accepted();
}

} // namespace mprisrelay::player
