#include "heartbeat_watchdog/sync/cooperative_executor.hpp"

#include <algorithm>

namespace heartbeat_watchdog
{

CooperativeExecutor::CooperativeExecutor(CooperativeClock & clock)
: clock_(clock)
{
}

void CooperativeExecutor::spawn(CooperativeTask & task)
{
  slots_.push_back({&task, clock_.now()});
}

bool CooperativeExecutor::cancel(CooperativeTask & task)
{
  auto it = std::find_if(slots_.begin(), slots_.end(),
      [&task](const Slot & slot) {return slot.task == &task;});
  if (it == slots_.end()) {
    return false;
  }
  if (polling_) {
    // Compacted after the current pass
    it->task = nullptr;
  } else {
    slots_.erase(it);
  }
  return true;
}

size_t CooperativeExecutor::run_once()
{
  const Instant now = clock_.now();
  size_t polled = 0;

  polling_ = true;
  // Index loop: spawn() from inside a poll may grow the vector
  for (size_t i = 0; i < slots_.size(); ++i) {
    if (slots_[i].task == nullptr || slots_[i].wake > now) {
      continue;
    }
    CooperativeTask * task = slots_[i].task;
    const Instant wake = task->poll(now);
    if (slots_[i].task == task) {
      slots_[i].wake = wake;
    }
    ++polled;
  }
  polling_ = false;

  slots_.erase(
    std::remove_if(slots_.begin(), slots_.end(),
      [](const Slot & slot) {return slot.task == nullptr;}),
    slots_.end());

  return polled;
}

std::optional<Instant> CooperativeExecutor::next_wake() const
{
  std::optional<Instant> earliest;
  for (const auto & slot : slots_) {
    if (slot.task != nullptr && (!earliest || slot.wake < *earliest)) {
      earliest = slot.wake;
    }
  }
  return earliest;
}

void CooperativeExecutor::run_until(Instant deadline, const std::function<void()> & idle)
{
  for (;;) {
    run_once();
    if (clock_.now() >= deadline) {
      break;
    }
    idle();
  }
}

size_t CooperativeExecutor::task_count() const
{
  return static_cast<size_t>(std::count_if(slots_.begin(), slots_.end(),
           [](const Slot & slot) {return slot.task != nullptr;}));
}

}  // namespace heartbeat_watchdog
