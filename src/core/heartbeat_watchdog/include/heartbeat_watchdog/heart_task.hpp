#ifndef HEARTBEAT_WATCHDOG__HEART_TASK_HPP_
#define HEARTBEAT_WATCHDOG__HEART_TASK_HPP_

#include <cstdint>
#include <system_error>

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/heart_cadence.hpp"
#include "heartbeat_watchdog/sync/cooperative_executor.hpp"

namespace heartbeat_watchdog
{

/// Heartbeat producer for the cooperative model.
///
/// Sends one edge whenever the cadence is due and yields until the next
/// period otherwise. On a transport error the edge is kept and the send is
/// retried on the next poll; the error is recorded for the host to inspect.
class HeartTask : public CooperativeTask
{
public:
  HeartTask(Duration period, EdgeTransport & transport);

  Instant poll(Instant now) override;

  const HeartCadence & cadence() const;

  uint64_t beats_sent() const;

  uint64_t error_count() const;

  /// Most recent transport error (cleared by the next successful send)
  std::error_code last_error() const;

private:
  HeartCadence cadence_;
  EdgeTransport & transport_;
  uint64_t beats_sent_{0};
  uint64_t error_count_{0};
  std::error_code last_error_;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__HEART_TASK_HPP_
