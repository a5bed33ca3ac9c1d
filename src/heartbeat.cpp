// ============================================================================
// heartbeat.cpp: implementation for heartbeat.hpp
// ============================================================================

#include "ledlink/heartbeat.hpp"

namespace ledlink {

HeartbeatKeeper::~HeartbeatKeeper() {
  stop();
}

void HeartbeatKeeper::start(std::chrono::milliseconds interval, AliveFn alive, BeatFn beat, Logger log) {
  stop();
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }
  beats_ = 0;
  running_ = true;
  thread_ = std::thread(&HeartbeatKeeper::loop, this, interval,
                        std::move(alive), std::move(beat), std::move(log));
}

void HeartbeatKeeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void HeartbeatKeeper::loop(std::chrono::milliseconds interval, AliveFn alive, BeatFn beat, Logger log) {
  log.debug("heartbeat started interval_ms=" + std::to_string(interval.count()));

  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) break;
    }

    if (!alive()) {
      log.debug("heartbeat: connection no longer live");
      break;
    }

    Error err;
    if (!beat(err)) {
      log.warn("heartbeat write failed, stopping: " + err.describe());
      break;
    }
    ++beats_;
  }

  running_ = false;
  log.debug("heartbeat stopped beats=" + std::to_string(beats_.load()));
}

} // namespace ledlink
