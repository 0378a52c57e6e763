#ifndef HEARTBEAT_WATCHDOG__WATCHDOG_TASK_HPP_
#define HEARTBEAT_WATCHDOG__WATCHDOG_TASK_HPP_

#include <cstdint>
#include <system_error>

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/health_tracker.hpp"
#include "heartbeat_watchdog/runner_config.hpp"
#include "heartbeat_watchdog/sync/cooperative_executor.hpp"
#include "heartbeat_watchdog/watchdog.hpp"

namespace heartbeat_watchdog
{

/// Receiver for the cooperative model; the counterpart of WatchdogRunner.
///
/// Each poll drains the edges already available (zero-timeout receives),
/// observes them stamped with the poll instant, and runs check() otherwise.
/// As in WatchdogRunner, the first edge after each arm() only resynchronises.
/// Only the first edge of a poll is judged; later in-order edges drained by
/// the same poll share its stamp and are counted in beats_coalesced().
/// poll_interval should stay well below the acceptance tolerances.
/// Warm-up is a yield until the warm-up deadline. Transport errors are
/// recorded and polling continues.
///
/// When edges come straight from an interrupt handler instead of a
/// transport, the handler may call Watchdog::observe() directly.
class WatchdogTask : public CooperativeTask
{
public:
  WatchdogTask(Watchdog & watchdog, EdgeTransport & transport, const RunnerConfig & config);

  Instant poll(Instant now) override;

  HealthTracker & tracker();

  const HealthTracker & tracker() const;

  uint64_t beats_observed() const;

  /// Edges that arrived in the same poll as an earlier one
  uint64_t beats_coalesced() const;

  uint64_t error_count() const;

  std::error_code last_error() const;

private:
  Instant begin_warmup(Instant now, bool initial);
  void finish_warmup(Instant now);

  Watchdog & watchdog_;
  EdgeTransport & transport_;
  const RunnerConfig config_;
  HealthTracker tracker_;

  bool started_{false};
  bool warming_up_{false};
  bool initial_warmup_{false};
  uint32_t synced_generation_{0};
  uint64_t beats_observed_{0};
  uint64_t beats_coalesced_{0};
  uint64_t error_count_{0};
  std::error_code last_error_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__WATCHDOG_TASK_HPP_
