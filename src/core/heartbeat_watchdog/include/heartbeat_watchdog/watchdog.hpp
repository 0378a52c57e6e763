#ifndef HEARTBEAT_WATCHDOG__WATCHDOG_HPP_
#define HEARTBEAT_WATCHDOG__WATCHDOG_HPP_

#include <atomic>
#include <cstdint>

#include "heartbeat_watchdog/sync/atomic_state.hpp"
#include "heartbeat_watchdog/types.hpp"
#include "heartbeat_watchdog/verdict.hpp"
#include "heartbeat_watchdog/watchdog_config.hpp"

namespace heartbeat_watchdog
{

/// Heartbeat detection state machine.
///
/// Consumes timestamped edges and decides whether the producer is healthy,
/// silent (TIMEOUT), jittering (WINDOW) or misordered (OUT_OF_ORDER).
///
/// observe() per beat, in order of precedence:
///   1. disarmed                       -> healthy, nothing changes
///   2. elapsed >= max_silence         -> TIMEOUT, state not advanced
///   3. ordered && edge != expected    -> OUT_OF_ORDER, state not advanced
///   4. elapsed outside the window     -> WINDOW, state advanced
///   5. otherwise                      -> healthy, state advanced
/// where "advanced" means last_accepted = beat time and the expected edge flips.
/// Silence and misordering never move the timing reference; tolerable
/// jitter always does.
///
/// check() applies only the TIMEOUT rule against a given instant, for hosts
/// that poll health on a timer.
///
/// State is held in independently atomic fields. observe() calls must be
/// serialized by the caller; arm(), disarm() and check() may run from other
/// contexts. Neither observe() nor check() blocks, so both are usable from a
/// timing-sensitive path or an interrupt handler.
class Watchdog
{
public:
  /// @throws std::invalid_argument if config.validate() fails
  explicit Watchdog(const WatchdogConfig & config);

  Watchdog(const Watchdog &) = delete;
  Watchdog & operator=(const Watchdog &) = delete;

  /// Start (or restart) monitoring; the silence clock restarts at `now`
  void arm(Instant now);

  /// Pause monitoring. Takes effect no later than the next observe()/check().
  void disarm();

  bool is_armed() const;

  /// Incremented by every arm(). Receivers compare it against the value they
  /// last synchronised at, so an arm() from another context also triggers a
  /// resync.
  uint32_t arm_generation() const;

  /// Evaluate one received edge
  Verdict observe(const Beat & beat);

  /// Evaluate silence only, without a new edge
  Verdict check(Instant now) const;

  /// Take `beat` as the new reference without judging it: last_accepted
  /// moves to its time and the opposite edge is expected next. Receivers use
  /// this for the first edge after each arm(), whose phase is arbitrary.
  /// No effect while disarmed.
  void resync(const Beat & beat);

  const WatchdogConfig & config() const;

  Instant last_accepted() const;

  Edge expected_edge() const;

private:
  Duration silence_since(Instant now) const;
  void accept(const Beat & beat);

  const WatchdogConfig config_;
  const AcceptanceWindow window_;
  AtomicInstant last_accepted_;
  AtomicEdge expected_edge_{Edge::RISING};
  std::atomic<uint32_t> arm_generation_{0};
  std::atomic<bool> armed_{false};
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__WATCHDOG_HPP_
