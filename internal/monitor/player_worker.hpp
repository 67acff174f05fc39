#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/player/player_facade.hpp"
#include "internal/util/blocking_queue.hpp"

namespace mprisrelay::monitor {

struct ProbePolicy {
  unsigned                  attempts = 3;
  std::chrono::milliseconds backoff{100};
  std::chrono::milliseconds call_timeout{2000};
};

/*
  PlayerWorker

  One per discovered player. Probes the player (with retry), announces
  it, then applies property notifications in arrival order. Callbacks run
  on the worker thread:

    on_ready    once, after probing (successful or degraded)
    on_changed  after each notification that changed the snapshot

  Stop() drops anything still queued; once it returns no callback runs.
*/
class PlayerWorker {
 public:
  using Callback = std::function<void()>;

  PlayerWorker(std::shared_ptr<player::PlayerFacade> facade, ProbePolicy policy, Callback on_ready,
               Callback on_changed);
  ~PlayerWorker();

  PlayerWorker(const PlayerWorker&)            = delete;
  PlayerWorker& operator=(const PlayerWorker&) = delete;

  void Start();
  void Stop();

  void PostChange(bus::PropertyMap changed, std::vector<std::string> invalidated);
  void PostSeeked(std::int64_t position_us);

 private:
  struct Change {
    bus::PropertyMap         changed;
    std::vector<std::string> invalidated;
  };
  struct Seeked {
    std::int64_t position_us;
  };
  using Item = std::variant<Change, Seeked>;

  void Run();
  void ProbeWithRetry();
  bool SleepUnlessStopped(std::chrono::milliseconds delay);

  std::shared_ptr<player::PlayerFacade> facade_;
  ProbePolicy                           policy_;
  Callback                              on_ready_;
  Callback                              on_changed_;

  util::BlockingQueue<Item> queue_;
  std::thread               thread_;

  std::mutex              stop_mu_;
  std::condition_variable stop_cv_;
  bool                    stopping_ = false;
};

} // namespace mprisrelay::monitor
