#pragma once
/**
 * @file heartbeat.hpp
 * @brief Background keep-alive for one live connection.
 *
 * One HeartbeatKeeper per successful connect. Its thread sleeps on a
 * condition variable for the interval, then:
 *   - exits if stop() was requested,
 *   - exits if alive() reports the connection is no longer live,
 *   - otherwise calls beat(); a failed beat ends the loop.
 *
 * The keeper never reads. Heartbeat answers are skipped by whichever
 * command cycle is reading at the time.
 *
 * stop() wakes the thread and joins it, so no beat() call can start after
 * stop() returns.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "ledlink/error.hpp"
#include "ledlink/log.hpp"

namespace ledlink {

class HeartbeatKeeper {
public:
  using AliveFn = std::function<bool()>;
  using BeatFn  = std::function<bool(Error&)>;

  HeartbeatKeeper() = default;
  ~HeartbeatKeeper();

  HeartbeatKeeper(const HeartbeatKeeper&) = delete;
  HeartbeatKeeper& operator=(const HeartbeatKeeper&) = delete;

  /**
   * @brief Start the loop; a running keeper is stopped first.
   * @param interval  Time between beats; the first beat is one interval after start.
   * @param alive     Checked before every beat.
   * @param beat      Writes one heartbeat frame.
   */
  void start(std::chrono::milliseconds interval, AliveFn alive, BeatFn beat, Logger log);

  /// Signal and join. Idempotent; safe from any thread except the keeper's own.
  void stop();

  /// True while the loop thread has not exited.
  bool running() const { return running_.load(); }

  /// Beats successfully written since the last start().
  uint64_t beats_sent() const { return beats_.load(); }

private:
  void loop(std::chrono::milliseconds interval, AliveFn alive, BeatFn beat, Logger log);

  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> beats_{0};
};

} // namespace ledlink
