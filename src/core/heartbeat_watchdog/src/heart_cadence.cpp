#include "heartbeat_watchdog/heart_cadence.hpp"

namespace heartbeat_watchdog
{

HeartCadence::HeartCadence(Duration period)
: period_(period)
{
}

std::optional<Instant> HeartCadence::next_due() const
{
  if (!last_sent_) {
    return std::nullopt;
  }
  return *last_sent_ + period_;
}

bool HeartCadence::due(Instant now) const
{
  const auto next = next_due();
  return !next || now >= *next;
}

Edge HeartCadence::next_edge() const
{
  return next_edge_;
}

void HeartCadence::on_sent(Instant now)
{
  last_sent_ = now;
  next_edge_ = opposite(next_edge_);
}

Duration HeartCadence::period() const
{
  return period_;
}

}  // namespace heartbeat_watchdog
