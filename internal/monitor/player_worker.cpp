#include "internal/monitor/player_worker.hpp"

#include "internal/observability/logging.hpp"

namespace mprisrelay::monitor {

PlayerWorker::PlayerWorker(std::shared_ptr<player::PlayerFacade> facade, ProbePolicy policy, Callback on_ready,
                           Callback on_changed)
    : facade_(std::move(facade)),
      policy_(policy),
      on_ready_(std::move(on_ready)),
      on_changed_(std::move(on_changed)) {
}

PlayerWorker::~PlayerWorker() {
  Stop();
}

void PlayerWorker::Start() {
  thread_ = std::thread(&PlayerWorker::Run, this);
}

void PlayerWorker::Stop() {
  {
    std::lock_guard lock(stop_mu_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  queue_.Close();
  if (thread_.joinable()) thread_.join();
}

void PlayerWorker::PostChange(bus::PropertyMap changed, std::vector<std::string> invalidated) {
  queue_.TryEnqueue(Change{std::move(changed), std::move(invalidated)});
}

void PlayerWorker::PostSeeked(std::int64_t position_us) {
  queue_.TryEnqueue(Seeked{position_us});
}

bool PlayerWorker::SleepUnlessStopped(std::chrono::milliseconds delay) {
  std::unique_lock lock(stop_mu_);
  return !stop_cv_.wait_for(lock, delay, [&] { return stopping_; });
}

void PlayerWorker::ProbeWithRetry() {
  auto backoff = policy_.backoff;

  for (unsigned attempt = 1; attempt <= policy_.attempts; ++attempt) {
    try {
      facade_->Probe(policy_.call_timeout);
      return;
    } catch (const bus::BusError& e) {
      MPRISRELAY_LOG_WARN("Player probe failed", {observability::StringField("bus_name", facade_->BusName()),
                                                  observability::IntField("attempt", attempt),
                                                  observability::StringField("error", e.what())});
    }
    if (attempt < policy_.attempts) {
      if (!SleepUnlessStopped(backoff)) return;
      backoff *= 2;
    }
  }

  MPRISRELAY_LOG_WARN("Player reported as degraded", {observability::StringField("bus_name", facade_->BusName())});
  facade_->MarkDegraded();
}

void PlayerWorker::Run() {
  ProbeWithRetry();

  {
    std::lock_guard lock(stop_mu_);
    if (stopping_) return;
  }
  on_ready_();

  while (auto item = queue_.Dequeue()) {
    bool changed = false;
    if (auto* change = std::get_if<Change>(&*item)) {
      changed = facade_->ApplyChange(change->changed, change->invalidated);
      // A signal from a degraded player means it answers again.
      if (facade_->Degraded() && facade_->Refresh(policy_.call_timeout)) {
        MPRISRELAY_LOG_INFO("Player recovered", {observability::StringField("bus_name", facade_->BusName())});
        changed = true;
      }
    } else {
      changed = facade_->ApplySeeked(std::get<Seeked>(*item).position_us);
    }
    if (changed) on_changed_();
  }
}

} // namespace mprisrelay::monitor
