#include "heartbeat_watchdog/health_tracker.hpp"

#include <utility>

namespace heartbeat_watchdog
{

HealthTracker::HealthTracker(uint32_t min_beats)
: min_beats_(min_beats == 0 ? 1 : min_beats)
{
}

void HealthTracker::set_listener(Listener listener)
{
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void HealthTracker::reset()
{
  streak_ = 0;
  state_.store(static_cast<uint8_t>(HealthState::FAULT), std::memory_order_release);
  publish(StateEvent{HealthState::FAULT, FaultReason::INITIAL, Verdict::healthy()});
}

bool HealthTracker::on_beat(const Verdict & verdict)
{
  if (!verdict.ok()) {
    return enter_fault(verdict);
  }

  if (streak_ < min_beats_) {
    streak_++;
  }
  if (state() == HealthState::FAULT && streak_ >= min_beats_) {
    state_.store(static_cast<uint8_t>(HealthState::OK), std::memory_order_release);
    publish(StateEvent{HealthState::OK, last_event().reason, verdict});
    return true;
  }
  return false;
}

bool HealthTracker::on_check(const Verdict & verdict)
{
  if (!verdict.ok()) {
    return enter_fault(verdict);
  }
  return false;
}

HealthState HealthTracker::state() const
{
  return static_cast<HealthState>(state_.load(std::memory_order_acquire));
}

bool HealthTracker::is_ok() const
{
  return state() == HealthState::OK;
}

StateEvent HealthTracker::last_event() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_event_;
}

uint32_t HealthTracker::healthy_streak() const
{
  return streak_.load();
}

uint32_t HealthTracker::min_beats() const
{
  return min_beats_;
}

bool HealthTracker::enter_fault(const Verdict & verdict)
{
  streak_ = 0;
  if (state() == HealthState::FAULT) {
    return false;
  }
  state_.store(static_cast<uint8_t>(HealthState::FAULT), std::memory_order_release);
  publish(StateEvent{HealthState::FAULT, reason_for(verdict.kind), verdict});
  return true;
}

void HealthTracker::publish(const StateEvent & event)
{
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_event_ = event;
    listener = listener_;
  }
  if (listener) {
    listener(event);
  }
}

FaultReason reason_for(FaultKind kind)
{
  switch (kind) {
    case FaultKind::TIMEOUT:      return FaultReason::TIMEOUT;
    case FaultKind::WINDOW:       return FaultReason::WINDOW;
    case FaultKind::OUT_OF_ORDER: return FaultReason::OUT_OF_ORDER;
    case FaultKind::NONE:         break;
  }
  return FaultReason::INITIAL;
}

const char * to_string(HealthState state)
{
  switch (state) {
    case HealthState::FAULT: return "FAULT";
    case HealthState::OK:    return "OK";
  }
  return "UNKNOWN";
}

const char * to_string(FaultReason reason)
{
  switch (reason) {
    case FaultReason::INITIAL:      return "INITIAL";
    case FaultReason::TIMEOUT:      return "TIMEOUT";
    case FaultReason::WINDOW:       return "WINDOW";
    case FaultReason::OUT_OF_ORDER: return "OUT_OF_ORDER";
  }
  return "UNKNOWN";
}

}  // namespace heartbeat_watchdog
