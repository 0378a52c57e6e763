#include "heartbeat_watchdog/sync/cooperative_clock.hpp"

namespace heartbeat_watchdog
{

CooperativeClock::CooperativeClock(Duration tick_period)
: tick_period_(tick_period)
{
}

Instant CooperativeClock::now() const
{
  const auto ticks = static_cast<Duration::rep>(ticks_.load(std::memory_order_acquire));
  return Instant(tick_period_ * ticks);
}

void CooperativeClock::tick()
{
  ticks_.fetch_add(1, std::memory_order_acq_rel);
}

void CooperativeClock::advance(uint64_t ticks)
{
  ticks_.fetch_add(ticks, std::memory_order_acq_rel);
}

bool CooperativeClock::await_until(Instant deadline) const
{
  return now() >= deadline;
}

uint64_t CooperativeClock::ticks() const
{
  return ticks_.load(std::memory_order_acquire);
}

Duration CooperativeClock::tick_period() const
{
  return tick_period_;
}

}  // namespace heartbeat_watchdog
