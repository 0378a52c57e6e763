#include "heartbeat_watchdog/watchdog_task.hpp"

#include <optional>

namespace heartbeat_watchdog
{

WatchdogTask::WatchdogTask(
  Watchdog & watchdog, EdgeTransport & transport, const RunnerConfig & config)
: watchdog_(watchdog),
  transport_(transport),
  config_(config),
  tracker_(config.min_beats)
{
}

Instant WatchdogTask::poll(Instant now)
{
  if (!started_) {
    started_ = true;
    tracker_.reset();
    return begin_warmup(now, true);
  }
  if (warming_up_) {
    finish_warmup(now);
  }

  bool stamped_now = false;
  for (;;) {
    std::optional<Beat> beat;
    if (auto ec = transport_.recv_timeout(Duration::zero(), beat)) {
      last_error_ = ec;
      error_count_++;
      break;
    }
    if (!beat) {
      break;
    }
    if (!watchdog_.is_armed()) {
      continue;
    }
    const uint32_t generation = watchdog_.arm_generation();
    if (!transport_.stamps_beats()) {
      beat->observed_at = now;
      // A late poll drains several edges with one stamp. After the first, an
      // edge of the expected polarity follows its predecessor instead of
      // being measured at zero elapsed time.
      if (stamped_now && generation == synced_generation_ &&
        (!watchdog_.config().ordered || beat->edge == watchdog_.expected_edge()))
      {
        watchdog_.resync(*beat);
        beats_coalesced_++;
        continue;
      }
      stamped_now = true;
    }
    if (generation != synced_generation_) {
      watchdog_.resync(*beat);
      synced_generation_ = generation;
      continue;
    }
    beats_observed_++;
    if (tracker_.on_beat(watchdog_.observe(*beat)) && !tracker_.is_ok()) {
      return begin_warmup(now, false);
    }
  }

  if (watchdog_.is_armed() && tracker_.on_check(watchdog_.check(now)) && !tracker_.is_ok()) {
    return begin_warmup(now, false);
  }
  return now + config_.poll_interval;
}

HealthTracker & WatchdogTask::tracker()
{
  return tracker_;
}

const HealthTracker & WatchdogTask::tracker() const
{
  return tracker_;
}

uint64_t WatchdogTask::beats_observed() const
{
  return beats_observed_;
}

uint64_t WatchdogTask::beats_coalesced() const
{
  return beats_coalesced_;
}

uint64_t WatchdogTask::error_count() const
{
  return error_count_;
}

std::error_code WatchdogTask::last_error() const
{
  return last_error_;
}

Instant WatchdogTask::begin_warmup(Instant now, bool initial)
{
  initial_warmup_ = initial;
  if (config_.warmup <= Duration::zero()) {
    finish_warmup(now);
    return now + config_.poll_interval;
  }
  warming_up_ = true;
  return now + config_.warmup;
}

void WatchdogTask::finish_warmup(Instant now)
{
  warming_up_ = false;
  if (auto ec = transport_.clear()) {
    last_error_ = ec;
    error_count_++;
  }
  if (initial_warmup_ || watchdog_.is_armed()) {
    watchdog_.arm(now);
  }
}

}  // namespace heartbeat_watchdog
