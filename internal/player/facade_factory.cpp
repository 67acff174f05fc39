#include "internal/player/facade_factory.hpp"

#include <algorithm>
#include <cctype>

#include "internal/player/quirk_facades.hpp"

namespace mprisrelay::player {

namespace {

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

const char* ToString(FacadeKind kind) {
  switch (kind) {
    case FacadeKind::kStandard:
      return "standard";
    case FacadeKind::kChromium:
      return "chromium";
    case FacadeKind::kVlc:
      return "vlc";
    case FacadeKind::kSpotify:
      return "spotify";
  }
  return "standard";
}

bool IsPlayerBusName(const std::string& bus_name) {
  return bus_name.size() > std::char_traits<char>::length(kMprisPrefix) && StartsWith(bus_name, kMprisPrefix);
}

std::string BusNameSuffix(const std::string& bus_name) {
  if (!IsPlayerBusName(bus_name)) return bus_name;
  return bus_name.substr(std::char_traits<char>::length(kMprisPrefix));
}

FacadeKind SelectFacadeKind(const std::string& bus_name) {
  auto app = BusNameSuffix(bus_name);
  app      = app.substr(0, app.find('.'));
  std::transform(app.begin(), app.end(), app.begin(), [](unsigned char c) { return std::tolower(c); });

  if (app == "chromium" || app == "chrome" || app == "brave" || app == "vivaldi") return FacadeKind::kChromium;
  if (app == "vlc") return FacadeKind::kVlc;
  if (app == "spotify") return FacadeKind::kSpotify;
  return FacadeKind::kStandard;
}

std::unique_ptr<PlayerFacade> MakeFacade(FacadeKind kind, std::shared_ptr<bus::Bus> bus, std::string bus_name,
                                         std::string owner) {
  switch (kind) {
    case FacadeKind::kChromium:
      return std::make_unique<ChromiumFacade>(std::move(bus), std::move(bus_name), std::move(owner));
    case FacadeKind::kVlc:
      return std::make_unique<VlcFacade>(std::move(bus), std::move(bus_name), std::move(owner));
    case FacadeKind::kSpotify:
      return std::make_unique<SpotifyFacade>(std::move(bus), std::move(bus_name), std::move(owner));
    case FacadeKind::kStandard:
      break;
  }
  return std::make_unique<PlayerFacade>(std::move(bus), std::move(bus_name), std::move(owner));
}

} // namespace mprisrelay::player
