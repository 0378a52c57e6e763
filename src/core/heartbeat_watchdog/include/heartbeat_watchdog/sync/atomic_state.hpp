#ifndef HEARTBEAT_WATCHDOG__SYNC__ATOMIC_STATE_HPP_
#define HEARTBEAT_WATCHDOG__SYNC__ATOMIC_STATE_HPP_

#include <atomic>
#include <cstdint>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Instant that one context writes and another reads without a lock.
/// Stored as the tick count since the clock epoch.
class AtomicInstant
{
public:
  explicit AtomicInstant(Instant initial = Instant{})
  : ticks_(initial.time_since_epoch().count())
  {
  }

  Instant load() const
  {
    return Instant(Duration(ticks_.load(std::memory_order_acquire)));
  }

  void store(Instant value)
  {
    ticks_.store(value.time_since_epoch().count(), std::memory_order_release);
  }

private:
  std::atomic<Duration::rep> ticks_;
};

/// Edge polarity shared across execution contexts
class AtomicEdge
{
public:
  explicit AtomicEdge(Edge initial = Edge::RISING)
  : value_(static_cast<uint8_t>(initial))
  {
  }

  Edge load() const
  {
    return static_cast<Edge>(value_.load(std::memory_order_acquire));
  }

  void store(Edge value)
  {
    value_.store(static_cast<uint8_t>(value), std::memory_order_release);
  }

private:
  std::atomic<uint8_t> value_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__SYNC__ATOMIC_STATE_HPP_
