#pragma once

#include <memory>
#include <string>

#include "internal/player/player_facade.hpp"

namespace mprisrelay::player {

enum class FacadeKind { kStandard, kChromium, kVlc, kSpotify };

const char* ToString(FacadeKind kind);

// Pure function of the service name, evaluated once per discovery.
// "org.mpris.MediaPlayer2.chromium.instance4242" -> kChromium
FacadeKind SelectFacadeKind(const std::string& bus_name);

std::unique_ptr<PlayerFacade> MakeFacade(FacadeKind kind, std::shared_ptr<bus::Bus> bus, std::string bus_name,
                                         std::string owner);

// "org.mpris.MediaPlayer2.vlc.instance7" -> "vlc.instance7"
std::string BusNameSuffix(const std::string& bus_name);

bool IsPlayerBusName(const std::string& bus_name);

} // namespace mprisrelay::player
