#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/bus/bus.hpp"
#include "internal/monitor/player_worker.hpp"
#include "internal/util/blocking_queue.hpp"
#include "mprisrelay/v1/player.pb.h"

namespace mprisrelay::monitor {

/*
  Receives the monitor's event stream. Calls are made in stream order
  while the monitor's dispatch lock is held: implementations must not
  block and must not call back into the monitor.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void OnPlayerEvent(const mprisrelay::v1::PlayerEvent& event) = 0;
};

struct MonitorOptions {
  ProbePolicy               probe;
  unsigned                  bus_connect_attempts = 5;
  std::chrono::milliseconds bus_retry{1000};
  std::chrono::milliseconds max_reconnect_backoff{30000};
};

enum class MonitorState { kStarting, kRunning, kReconnecting, kUnavailable, kStopped };

const char* ToString(MonitorState state);

/*
  PlayerMonitor

  Maintains the live set of players on the session bus and turns bus
  activity into one ordered event stream:

    appeared(P) -> state_changed(P)* -> disappeared(P)

  A control thread owns the bus connection. Bus callbacks only enqueue
  onto it; it discovers names, starts and stops per-player workers and
  handles connection loss (every player disappears, then the monitor
  reconnects with capped backoff). If the bus cannot be reached at
  startup after `bus_connect_attempts`, the monitor gives up and stays
  kUnavailable; the rest of the process is unaffected.

  The monitor also keeps the last announced snapshot of every player so
  subscribers can sync before streaming (WithSnapshot).
*/
class PlayerMonitor {
 public:
  // Throws bus::BusError when no connection can be made.
  using BusConnector = std::function<std::shared_ptr<bus::Bus>()>;
  using SnapshotFn   = std::function<void(const std::vector<mprisrelay::v1::Player>&)>;

  PlayerMonitor(BusConnector connect, MonitorOptions options);
  ~PlayerMonitor();

  PlayerMonitor(const PlayerMonitor&)            = delete;
  PlayerMonitor& operator=(const PlayerMonitor&) = delete;

  void Start();
  // Every player disappears, workers stop and signals are unsubscribed.
  void Stop();

  MonitorState State() const;
  bool         WaitForState(MonitorState state, std::chrono::milliseconds timeout) const;

  void AddSink(EventSink* sink);
  void RemoveSink(EventSink* sink);

  std::vector<mprisrelay::v1::Player> Players() const;

  // Runs `fn` on the current player set with event dispatch paused, so
  // nothing emitted before the call is missed or repeated afterwards.
  void WithSnapshot(const SnapshotFn& fn) const;

  // Routes to the player addressed by id or bus name. Never throws.
  mprisrelay::v1::CommandResult Execute(const mprisrelay::v1::Command& command,
                                        std::chrono::milliseconds    busy_timeout);

 private:
  struct Entry {
    std::string                           bus_name;
    std::string                           owner;
    std::shared_ptr<player::PlayerFacade> facade;
    std::unique_ptr<PlayerWorker>         worker;
    bool                                  announced = false;
    bool                                  removing  = false;
    mprisrelay::v1::Player                last;
  };

  struct ControlEvent {
    enum class Kind { kNameOwnerChanged, kPropertiesChanged, kSeeked, kBusLost, kStop };

    Kind                     kind;
    std::uint64_t            generation = 0;
    std::string              sender;
    std::string              name;
    std::string              old_owner;
    std::string              new_owner;
    std::string              interface;
    bus::PropertyMap         changed;
    std::vector<std::string> invalidated;
    std::int64_t             position_us = 0;
  };

  void ControlLoop();
  // Returns false when stopping.
  bool ConnectWithRetry(bool startup);
  // Returns false when stopping, true on bus loss.
  bool Serve();
  void Attach();
  void Detach(bool unsubscribe);

  void HandleNameOwnerChanged(const ControlEvent& event);
  void RouteToOwner(const ControlEvent& event);

  void AddPlayer(const std::string& bus_name, const std::string& owner);
  void RemovePlayer(const std::string& bus_name);
  void RemoveAllPlayers();

  void OnReady(Entry* entry);
  void OnChanged(Entry* entry);

  std::string ClaimPlayerIdLocked(const Entry& entry) const;
  void        EmitLocked(const mprisrelay::v1::PlayerEvent& event);
  void        SetState(MonitorState state);

  // Waits on the control queue; returns false when Stop arrives.
  bool Pause(std::chrono::milliseconds delay);

  BusConnector   connect_;
  MonitorOptions options_;

  util::BlockingQueue<ControlEvent> control_;
  std::thread                       thread_;

  // Control thread only.
  std::shared_ptr<bus::Bus>            bus_;
  std::vector<bus::Bus::SubscriptionId> subscriptions_;
  std::atomic<std::uint64_t>           generation_{0};
  bool                                 stop_requested_ = false;

  // Guards players_, sinks_ and event emission.
  mutable std::mutex                            dispatch_mu_;
  std::map<std::string, std::shared_ptr<Entry>> players_;
  std::vector<EventSink*>                       sinks_;

  mutable std::mutex              state_mu_;
  mutable std::condition_variable state_cv_;
  MonitorState                    state_ = MonitorState::kStopped;
};

} // namespace mprisrelay::monitor
