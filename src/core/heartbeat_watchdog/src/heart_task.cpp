#include "heartbeat_watchdog/heart_task.hpp"

namespace heartbeat_watchdog
{

HeartTask::HeartTask(Duration period, EdgeTransport & transport)
: cadence_(period), transport_(transport)
{
}

Instant HeartTask::poll(Instant now)
{
  if (!cadence_.due(now)) {
    return *cadence_.next_due();
  }

  if (auto ec = transport_.send(cadence_.next_edge())) {
    last_error_ = ec;
    error_count_++;
    return now;  // retry on the next pass
  }

  cadence_.on_sent(now);
  last_error_.clear();
  beats_sent_++;
  return *cadence_.next_due();
}

const HeartCadence & HeartTask::cadence() const
{
  return cadence_;
}

uint64_t HeartTask::beats_sent() const
{
  return beats_sent_;
}

uint64_t HeartTask::error_count() const
{
  return error_count_;
}

std::error_code HeartTask::last_error() const
{
  return last_error_;
}

}  // namespace heartbeat_watchdog
