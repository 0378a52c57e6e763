#ifndef HEARTBEAT_WATCHDOG__SYNC__BLOCKING_CLOCK_HPP_
#define HEARTBEAT_WATCHDOG__SYNC__BLOCKING_CLOCK_HPP_

#include <condition_variable>
#include <mutex>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Time source for the multi-threaded blocking model.
///
/// Clock contract (also met by test clocks):
///   Instant now() const;
///   bool sleep_until(Instant deadline);   // false if the wait was interrupted
///
/// Sleeps wait on a condition variable so that interrupt() can release a
/// thread parked between beats (shutdown, stop of a receiver loop).
class BlockingClock
{
public:
  BlockingClock() = default;

  BlockingClock(const BlockingClock &) = delete;
  BlockingClock & operator=(const BlockingClock &) = delete;

  Instant now() const;

  /// Block until `deadline`. Returns immediately if it has already passed.
  /// @return false if interrupted before the deadline
  bool sleep_until(Instant deadline);

  /// Wake all sleepers; further sleeps fail immediately until reset()
  void interrupt();

  void reset();

  bool interrupted() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_{false};
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__SYNC__BLOCKING_CLOCK_HPP_
