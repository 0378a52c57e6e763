#ifndef HEARTBEAT_WATCHDOG__WATCHDOG_RUNNER_HPP_
#define HEARTBEAT_WATCHDOG__WATCHDOG_RUNNER_HPP_

#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/health_tracker.hpp"
#include "heartbeat_watchdog/runner_config.hpp"
#include "heartbeat_watchdog/sync/blocking_clock.hpp"
#include "heartbeat_watchdog/watchdog.hpp"

namespace heartbeat_watchdog
{

/// Receiver loop for the multi-threaded blocking model.
///
/// Lifecycle:
///   1. start()  spawn the receiver thread (or call run() on your own thread)
///   2. run()    warm up, arm, then loop:
///                   recv_timeout(poll_interval)
///                   -> observe() on an edge, check() on silence
///                   -> health tracker
///                 and warm up again after every transition into FAULT
///   3. stop()   interrupt waits and join
///
/// Beats are stamped with the runner's clock on reception unless the
/// transport stamps them itself. The first edge after each arm(), whether
/// from a warm-up or from another thread, only resynchronises the watchdog
/// (Watchdog::resync) and is not judged. While the watchdog is disarmed,
/// edges are drained but not judged. A transport error ends the loop and is returned
/// unchanged.
class WatchdogRunner
{
public:
  WatchdogRunner(Watchdog & watchdog, EdgeTransport & transport, const RunnerConfig & config);
  ~WatchdogRunner();

  WatchdogRunner(const WatchdogRunner &) = delete;
  WatchdogRunner & operator=(const WatchdogRunner &) = delete;

  /// Run on a dedicated thread
  /// @return false if already running
  bool start();

  /// Request the loop to end and join the thread (if any)
  void stop();

  /// Run on the calling thread until stop() or a transport error
  std::error_code run();

  bool running() const;

  /// Error that ended the last run (empty after a clean stop)
  std::error_code last_error() const;

  HealthTracker & tracker();

  const HealthTracker & tracker() const;

private:
  bool warmup(bool initial, std::error_code & ec);
  std::error_code finish(std::error_code ec);

  Watchdog & watchdog_;
  EdgeTransport & transport_;
  const RunnerConfig config_;
  HealthTracker tracker_;
  BlockingClock clock_;
  uint32_t synced_generation_{0};  // receiver thread only

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};

  mutable std::mutex error_mutex_;
  std::error_code last_error_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__WATCHDOG_RUNNER_HPP_
