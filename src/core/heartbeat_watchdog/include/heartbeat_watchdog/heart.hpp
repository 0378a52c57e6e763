#ifndef HEARTBEAT_WATCHDOG__HEART_HPP_
#define HEARTBEAT_WATCHDOG__HEART_HPP_

#include <system_error>

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/heart_cadence.hpp"
#include "heartbeat_watchdog/io_error.hpp"
#include "heartbeat_watchdog/sync/blocking_clock.hpp"
#include "heartbeat_watchdog/types.hpp"
#include "heartbeat_watchdog/watchdog_config.hpp"

namespace heartbeat_watchdog
{

/// Heartbeat producer for the blocking model.
///
/// Each beat() waits on the clock until one period has passed since the
/// previous successful send, then sends the current edge and flips it. The
/// first beat() sends immediately.
///
/// A transport error is returned unchanged and nothing advances: the next
/// beat() resends the same edge without waiting. Retry policy belongs to the
/// caller. An interrupted wait returns IoErrc::CANCELLED.
///
/// @tparam Clock  provides `Instant now() const` and `bool sleep_until(Instant)`
template<typename Clock = BlockingClock>
class Heart
{
public:
  Heart(Duration period, EdgeTransport & transport, Clock & clock)
  : cadence_(period), transport_(transport), clock_(clock)
  {
  }

  Heart(const WatchdogConfig & config, EdgeTransport & transport, Clock & clock)
  : Heart(config.period, transport, clock)
  {
  }

  std::error_code beat()
  {
    if (const auto due = cadence_.next_due()) {
      if (!clock_.sleep_until(*due)) {
        return make_error_code(IoErrc::CANCELLED);
      }
    }

    if (auto ec = transport_.send(cadence_.next_edge())) {
      return ec;
    }
    cadence_.on_sent(clock_.now());
    return {};
  }

  Edge next_edge() const
  {
    return cadence_.next_edge();
  }

  const HeartCadence & cadence() const
  {
    return cadence_;
  }

private:
  HeartCadence cadence_;
  EdgeTransport & transport_;
  Clock & clock_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__HEART_HPP_
