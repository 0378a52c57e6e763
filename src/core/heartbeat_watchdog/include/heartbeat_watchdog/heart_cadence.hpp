#ifndef HEARTBEAT_WATCHDOG__HEART_CADENCE_HPP_
#define HEARTBEAT_WATCHDOG__HEART_CADENCE_HPP_

#include <optional>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Beat scheduling shared by the blocking Heart and the cooperative HeartTask.
///
/// The reference time moves to the instant of each successful send, not to
/// the instant the wait began, so wake-up latency delays one beat instead of
/// accumulating across beats.
class HeartCadence
{
public:
  explicit HeartCadence(Duration period);

  /// When the next beat is due; std::nullopt before the first beat (send immediately)
  std::optional<Instant> next_due() const;

  bool due(Instant now) const;

  /// Edge the next beat carries (RISING first)
  Edge next_edge() const;

  /// Record a successful send at `now`: flip the edge, move the reference
  void on_sent(Instant now);

  Duration period() const;

private:
  Duration period_;
  Edge next_edge_{Edge::RISING};
  std::optional<Instant> last_sent_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__HEART_CADENCE_HPP_
