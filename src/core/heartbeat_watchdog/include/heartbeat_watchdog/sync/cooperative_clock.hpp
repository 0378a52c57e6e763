#ifndef HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_CLOCK_HPP_
#define HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_CLOCK_HPP_

#include <atomic>
#include <cstdint>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Time source for the single-threaded cooperative model.
///
/// A hardware timer interrupt calls tick() at a fixed rate; tasks read
/// now() and never block. Waiting is expressed as await_until(), a readiness
/// test: a task whose deadline is not reached returns to the executor and is
/// polled again later.
///
/// Instants share the steady_clock time_point type (epoch + ticks * tick
/// period), so the detection logic is identical under both models.
class CooperativeClock
{
public:
  explicit CooperativeClock(Duration tick_period);

  CooperativeClock(const CooperativeClock &) = delete;
  CooperativeClock & operator=(const CooperativeClock &) = delete;

  Instant now() const;

  /// Advance by one tick. Safe to call from an interrupt handler.
  void tick();

  /// Advance by `ticks` ticks
  void advance(uint64_t ticks);

  /// true once `deadline` has been reached; never blocks
  bool await_until(Instant deadline) const;

  uint64_t ticks() const;

  Duration tick_period() const;

private:
  Duration tick_period_;
  std::atomic<uint64_t> ticks_{0};
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_CLOCK_HPP_
