#include "internal/player/player_facade.hpp"

#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"

namespace mprisrelay::player {

namespace {

using mprisrelay::v1::CommandResult;
using mprisrelay::v1::RejectReason;

bool Flag(const bus::PropertyMap& props, const std::string& key) {
  const auto* value = bus::Find(props, key);
  return value && bus::AsBool(*value).value_or(false);
}

std::string Text(const bus::PropertyMap& props, const std::string& key) {
  const auto* value = bus::Find(props, key);
  return value ? bus::AsString(*value).value_or("") : "";
}

std::optional<double> Number(const bus::PropertyMap& props, const std::string& key) {
  const auto* value = bus::Find(props, key);
  return value ? bus::AsDouble(*value) : std::nullopt;
}

std::string JoinArtists(const bus::Value& value) {
  auto artists = bus::AsStringList(value);
  if (!artists) return "";
  std::string out;
  for (const auto& artist : *artists) {
    if (!out.empty()) out += ", ";
    out += artist;
  }
  return out;
}

bool SameSnapshot(const mprisrelay::v1::Player& a, const mprisrelay::v1::Player& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace

CommandResult Accepted() {
  CommandResult result;
  result.set_accepted(true);
  return result;
}

CommandResult Rejected(RejectReason reason, std::string detail) {
  CommandResult result;
  result.set_accepted(false);
  result.set_reason(reason);
  result.set_detail(std::move(detail));
  return result;
}

mprisrelay::v1::PlaybackState ParsePlaybackStatus(const bus::PropertyMap& props) {
  const auto* value = bus::Find(props, "PlaybackStatus");
  if (!value) return mprisrelay::v1::PLAYBACK_STATE_STOPPED;

  const auto status = bus::AsString(*value).value_or("");
  if (status == "Playing") return mprisrelay::v1::PLAYBACK_STATE_PLAYING;
  if (status == "Paused") return mprisrelay::v1::PLAYBACK_STATE_PAUSED;
  if (status == "Stopped") return mprisrelay::v1::PLAYBACK_STATE_STOPPED;
  return mprisrelay::v1::PLAYBACK_STATE_UNKNOWN;
}

mprisrelay::v1::TrackMetadata ParseMetadata(const bus::PropertyMap& props) {
  mprisrelay::v1::TrackMetadata metadata;

  const auto* value = bus::Find(props, "Metadata");
  const auto* map   = value ? bus::AsMap(*value) : nullptr;
  if (!map) return metadata;

  metadata.set_title(Text(*map, "xesam:title"));
  if (const auto* artist = bus::Find(*map, "xesam:artist")) metadata.set_artist(JoinArtists(*artist));
  metadata.set_album(Text(*map, "xesam:album"));
  if (const auto* length = bus::Find(*map, "mpris:length")) metadata.set_length_us(bus::AsInt64(*length).value_or(0));
  metadata.set_track_id(Text(*map, "mpris:trackid"));
  metadata.set_art_url(Text(*map, "mpris:artUrl"));
  return metadata;
}

// ------------------------------------------------------------
// PlayerFacade
// ------------------------------------------------------------

PlayerFacade::PlayerFacade(std::shared_ptr<bus::Bus> bus, std::string bus_name, std::string owner)
    : bus_(std::move(bus)), bus_name_(std::move(bus_name)), owner_(std::move(owner)) {
}

const char* PlayerFacade::Kind() const {
  return "standard";
}

void PlayerFacade::Probe(std::chrono::milliseconds timeout) {
  auto props = bus::GetAllProperties(*bus_, bus_name_, kMprisPath, kPlayerInterface, timeout);
  auto root  = bus::GetAllProperties(*bus_, bus_name_, kMprisPath, kRootInterface, timeout);
  props.insert(root.begin(), root.end());

  std::lock_guard lock(state_mu_);
  props_    = std::move(props);
  degraded_ = false;
}

bool PlayerFacade::Refresh(std::chrono::milliseconds timeout) {
  const auto before = Snapshot();
  try {
    Probe(timeout);
  } catch (const bus::BusError& e) {
    MPRISRELAY_LOG_DEBUG("Player refresh failed", {observability::StringField("bus_name", bus_name_),
                                                   observability::StringField("error", e.what())});
    return false;
  }
  return !SameSnapshot(before, Snapshot());
}

bool PlayerFacade::ApplyChange(const bus::PropertyMap& changed, const std::vector<std::string>& invalidated) {
  std::lock_guard lock(state_mu_);
  const auto      before = BuildSnapshotLocked();

  for (const auto& [key, value] : changed) {
    props_[key] = value;
  }
  for (const auto& key : invalidated) {
    props_.erase(key);
  }

  return !SameSnapshot(before, BuildSnapshotLocked());
}

bool PlayerFacade::ApplySeeked(std::int64_t position_us) {
  std::lock_guard lock(state_mu_);
  const auto*     current = bus::Find(props_, "Position");
  if (current && bus::AsInt64(*current) == position_us) return false;
  props_["Position"] = bus::Value(position_us);
  return true;
}

void PlayerFacade::MarkDegraded() {
  std::lock_guard lock(state_mu_);
  degraded_ = true;
}

bool PlayerFacade::Degraded() const {
  std::lock_guard lock(state_mu_);
  return degraded_;
}

std::string PlayerFacade::Identity() const {
  std::lock_guard lock(state_mu_);
  return Text(props_, "Identity");
}

std::string PlayerFacade::DesktopEntry() const {
  std::lock_guard lock(state_mu_);
  return Text(props_, "DesktopEntry");
}

bus::PropertyMap PlayerFacade::Properties() const {
  std::lock_guard lock(state_mu_);
  return props_;
}

mprisrelay::v1::Capabilities PlayerFacade::Capabilities() const {
  std::lock_guard lock(state_mu_);
  return DeriveCapabilities(props_);
}

mprisrelay::v1::Player PlayerFacade::Snapshot() const {
  std::lock_guard lock(state_mu_);
  return BuildSnapshotLocked();
}

mprisrelay::v1::Player PlayerFacade::BuildSnapshotLocked() const {
  mprisrelay::v1::Player player;
  player.set_bus_name(bus_name_);
  player.set_facade(Kind());
  player.set_degraded(degraded_);
  player.set_state(degraded_ ? mprisrelay::v1::PLAYBACK_STATE_UNKNOWN : ParsePlaybackStatus(props_));
  *player.mutable_metadata()     = ParseMetadata(props_);
  *player.mutable_capabilities() = DeriveCapabilities(props_);

  if (const auto* position = bus::Find(props_, "Position")) player.set_position_us(bus::AsInt64(*position).value_or(0));
  player.set_rate(Number(props_, "Rate").value_or(1.0));
  return player;
}

mprisrelay::v1::Capabilities PlayerFacade::DeriveCapabilities(const bus::PropertyMap& props) const {
  mprisrelay::v1::Capabilities caps;
  const bool control = Flag(props, "CanControl");

  caps.set_play(control && Flag(props, "CanPlay"));
  caps.set_pause(control && Flag(props, "CanPause"));
  caps.set_stop(control);
  caps.set_next(control && Flag(props, "CanGoNext"));
  caps.set_previous(control && Flag(props, "CanGoPrevious"));
  caps.set_seek(control && Flag(props, "CanSeek"));

  const auto min_rate = Number(props, "MinimumRate");
  const auto max_rate = Number(props, "MaximumRate");
  caps.set_set_rate(control && min_rate && max_rate && *max_rate > *min_rate);
  return caps;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

CommandResult PlayerFacade::Execute(const mprisrelay::v1::Command& command, std::chrono::milliseconds busy_timeout) {
  std::unique_lock lock(command_mu_, std::defer_lock);
  if (!lock.try_lock_for(busy_timeout)) {
    return Rejected(mprisrelay::v1::REJECT_REASON_PLAYER_BUSY, "another command is still running on " + bus_name_);
  }

  try {
    return Dispatch(command);
  } catch (const bus::BusError& e) {
    MPRISRELAY_LOG_WARN("Player command failed", {observability::StringField("bus_name", bus_name_),
                                                  observability::StringField("error", e.what())});
    return Rejected(mprisrelay::v1::REJECT_REASON_PLAYER_ERROR, e.what());
  }
}

CommandResult PlayerFacade::Dispatch(const mprisrelay::v1::Command& command) {
  using Action = mprisrelay::v1::Command::ActionCase;
  if (Degraded()) return Rejected(mprisrelay::v1::REJECT_REASON_PLAYER_ERROR, bus_name_ + " is not responding");
  const auto caps = Capabilities();

  auto simple = [&](bool allowed, const char* member) {
    if (!allowed) return Rejected(mprisrelay::v1::REJECT_REASON_UNSUPPORTED, std::string(member) + " is not supported");
    CallPlayer(member);
    return Accepted();
  };

  switch (command.action_case()) {
    case Action::kPlay:
      return simple(caps.play(), "Play");
    case Action::kPause:
      return simple(caps.pause(), "Pause");
    case Action::kNext:
      return simple(caps.next(), "Next");
    case Action::kPrevious:
      return simple(caps.previous(), "Previous");
    case Action::kStop:
      if (!caps.stop()) return Rejected(mprisrelay::v1::REJECT_REASON_UNSUPPORTED, "Stop is not supported");
      return DoStop();

    case Action::kSeek: {
      const auto position = command.seek().position_us();
      if (position < 0) return Rejected(mprisrelay::v1::REJECT_REASON_INVALID_ARGUMENT, "position must not be negative");
      if (caps.seek()) return DoSeek(position);
      if (position == 0 && caps.stop() && caps.play()) {
        // Rewind by restarting playback.
        auto stopped = DoStop();
        if (!stopped.accepted()) return stopped;
        CallPlayer("Play");
        return Accepted();
      }
      return Rejected(mprisrelay::v1::REJECT_REASON_UNSUPPORTED, "player does not support seeking");
    }

    case Action::kSetRate: {
      const auto rate = command.set_rate().rate();
      if (!caps.set_rate()) return Rejected(mprisrelay::v1::REJECT_REASON_UNSUPPORTED, "player does not support rate control");
      const auto props    = Properties();
      const auto min_rate = Number(props, "MinimumRate").value_or(1.0);
      const auto max_rate = Number(props, "MaximumRate").value_or(1.0);
      if (!(rate > 0.0) || rate < min_rate || rate > max_rate) {
        return Rejected(mprisrelay::v1::REJECT_REASON_INVALID_ARGUMENT, "rate out of range");
      }
      return DoSetRate(rate);
    }

    case Action::ACTION_NOT_SET:
      break;
  }
  return Rejected(mprisrelay::v1::REJECT_REASON_INVALID_ARGUMENT, "command has no action");
}

CommandResult PlayerFacade::DoStop() {
  CallPlayer("Stop");
  return Accepted();
}

CommandResult PlayerFacade::DoSeek(std::int64_t position_us) {
  if (!SetPosition(position_us)) SeekRelative(position_us);
  return Accepted();
}

CommandResult PlayerFacade::DoSetRate(double rate) {
  bus::SetProperty(*bus_, bus_name_, kMprisPath, kPlayerInterface, "Rate", bus::Value(rate));
  return Accepted();
}

void PlayerFacade::CallPlayer(const std::string& member, std::vector<bus::Value> args) {
  bus_->Call({bus_name_, kMprisPath, kPlayerInterface, member, std::move(args)});
}

bool PlayerFacade::SetPosition(std::int64_t position_us) {
  const auto track_id = ParseMetadata(Properties()).track_id();
  if (track_id.empty()) return false;
  CallPlayer("SetPosition", {bus::Value(bus::ObjectPath{track_id}), bus::Value(position_us)});
  return true;
}

void PlayerFacade::SeekRelative(std::int64_t position_us) {
  const auto current = Snapshot().position_us();
  CallPlayer("Seek", {bus::Value(static_cast<std::int64_t>(position_us - current))});
}

} // namespace mprisrelay::player
