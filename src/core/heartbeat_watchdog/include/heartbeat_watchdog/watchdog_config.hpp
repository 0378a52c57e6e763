#ifndef HEARTBEAT_WATCHDOG__WATCHDOG_CONFIG_HPP_
#define HEARTBEAT_WATCHDOG__WATCHDOG_CONFIG_HPP_

#include <chrono>
#include <string>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Accepted inter-beat interval, inclusive on both ends.
struct AcceptanceWindow
{
  Duration min{};
  Duration max{};

  bool contains(Duration elapsed) const
  {
    return elapsed >= min && elapsed <= max;
  }
};

/// Heartbeat timing parameters, shared by Heart and Watchdog.
///
///   period         : expected inter-beat interval
///   tolerance_low  : how early a beat may arrive (window lower bound = period - tolerance_low)
///   tolerance_high : how late a beat may arrive (window upper bound = period + tolerance_high)
///   max_silence    : TIMEOUT threshold since the last accepted beat,
///                     must be >= period + tolerance_high
///   ordered        : edges must strictly alternate polarity
struct WatchdogConfig
{
  Duration period{std::chrono::milliseconds(100)};
  Duration tolerance_low{std::chrono::milliseconds(10)};
  Duration tolerance_high{std::chrono::milliseconds(10)};
  Duration max_silence{std::chrono::milliseconds(200)};
  bool ordered{true};

  /// Defaults for a period: +/-10 % window, silence limit of two periods
  static WatchdogConfig from_period(Duration period);

  AcceptanceWindow window() const;

  /// Check consistency of the timing parameters.
  /// @param reason  if non-null, receives a description of the first violation
  /// @return true if the configuration is usable
  bool validate(std::string * reason = nullptr) const;
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__WATCHDOG_CONFIG_HPP_
