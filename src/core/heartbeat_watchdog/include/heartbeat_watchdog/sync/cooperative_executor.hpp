#ifndef HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_EXECUTOR_HPP_
#define HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_EXECUTOR_HPP_

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "heartbeat_watchdog/sync/cooperative_clock.hpp"
#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// A unit of cooperative work.
///
/// poll() runs until the task's next await point and returns the instant at
/// which it wants to be polled again. It must not block.
class CooperativeTask
{
public:
  virtual ~CooperativeTask() = default;

  virtual Instant poll(Instant now) = 0;
};

/// Single-threaded run-to-completion scheduler for bare-metal or
/// interrupt-driven targets.
///
/// Typical superloop:
///   executor.spawn(heart_task);
///   executor.spawn(watchdog_task);
///   for (;;) { executor.run_once(); __WFI(); }
///
/// Tasks are not owned and must outlive their registration. Tasks due in the
/// same pass are polled in spawn order.
class CooperativeExecutor
{
public:
  explicit CooperativeExecutor(CooperativeClock & clock);

  CooperativeExecutor(const CooperativeExecutor &) = delete;
  CooperativeExecutor & operator=(const CooperativeExecutor &) = delete;

  /// Register a task; it is first polled on the next run_once()
  void spawn(CooperativeTask & task);

  /// Unregister a task. Safe to call from inside a poll().
  /// @return false if the task was not registered
  bool cancel(CooperativeTask & task);

  /// Poll every task whose wake time has been reached
  /// @return number of tasks polled
  size_t run_once();

  /// Earliest wake time over all tasks, std::nullopt when idle
  std::optional<Instant> next_wake() const;

  /// Run passes until the clock reaches `deadline`, calling `idle` between
  /// passes (wait-for-interrupt on hardware, a simulated tick in tests)
  void run_until(Instant deadline, const std::function<void()> & idle);

  size_t task_count() const;

private:
  struct Slot
  {
    CooperativeTask * task{nullptr};
    Instant wake{};
  };

  CooperativeClock & clock_;
  std::vector<Slot> slots_;
  bool polling_{false};
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__SYNC__COOPERATIVE_EXECUTOR_HPP_
