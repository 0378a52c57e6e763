#ifndef HEARTBEAT_WATCHDOG__HEALTH_TRACKER_HPP_
#define HEARTBEAT_WATCHDOG__HEALTH_TRACKER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

#include "heartbeat_watchdog/verdict.hpp"

namespace heartbeat_watchdog
{

/// Aggregate health of a monitored producer
enum class HealthState : uint8_t
{
  FAULT = 0,
  OK = 1,
};

/// Why the tracker entered FAULT
enum class FaultReason : uint8_t
{
  INITIAL,  // monitoring (re)started, no proof of life yet
  TIMEOUT,
  WINDOW,
  OUT_OF_ORDER,
};

/// Emitted on every state transition
struct StateEvent
{
  HealthState state{HealthState::FAULT};
  FaultReason reason{FaultReason::INITIAL};
  Verdict verdict{};  // the verdict that caused the transition
};

/// Turns per-beat verdicts into a debounced OK/FAULT state.
///
/// Starts in FAULT/INITIAL. Any fault verdict enters FAULT and clears the
/// healthy streak; `min_beats` consecutive healthy beats are required to
/// return to OK. Only transitions are reported to the listener.
///
/// Verdicts are fed from one receiver context; state() may be read from any.
class HealthTracker
{
public:
  using Listener = std::function<void(const StateEvent &)>;

  explicit HealthTracker(uint32_t min_beats = 2);

  /// Called on every transition, outside any internal lock
  void set_listener(Listener listener);

  /// Return to FAULT/INITIAL (always reported)
  void reset();

  /// Feed the verdict of Watchdog::observe()
  /// @return true if the state changed
  bool on_beat(const Verdict & verdict);

  /// Feed the verdict of Watchdog::check(); a healthy check proves nothing
  /// @return true if the state changed
  bool on_check(const Verdict & verdict);

  HealthState state() const;

  bool is_ok() const;

  StateEvent last_event() const;

  uint32_t healthy_streak() const;

  uint32_t min_beats() const;

private:
  bool enter_fault(const Verdict & verdict);
  void publish(const StateEvent & event);

  const uint32_t min_beats_;
  std::atomic<uint32_t> streak_{0};
  std::atomic<uint8_t> state_{static_cast<uint8_t>(HealthState::FAULT)};

  mutable std::mutex mutex_;  // guards last_event_ and listener_
  StateEvent last_event_{};
  Listener listener_;
};

FaultReason reason_for(FaultKind kind);

const char * to_string(HealthState state);

const char * to_string(FaultReason reason);

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__HEALTH_TRACKER_HPP_
