#ifndef HEARTBEAT_WATCHDOG__RUNNER_CONFIG_HPP_
#define HEARTBEAT_WATCHDOG__RUNNER_CONFIG_HPP_

#include <chrono>
#include <cstdint>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Receiver loop settings, shared by WatchdogRunner and WatchdogTask.
struct RunnerConfig
{
  /// Blocking: longest single transport wait. Cooperative: poll period.
  /// Bounds how late a TIMEOUT is noticed and how long stop() takes.
  Duration poll_interval{std::chrono::milliseconds(10)};

  /// Pause after start and after each transition into FAULT, before the
  /// transport is cleared and the watchdog re-armed
  Duration warmup{std::chrono::milliseconds(200)};

  /// Consecutive healthy beats required to leave FAULT
  uint32_t min_beats{2};
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__RUNNER_CONFIG_HPP_
