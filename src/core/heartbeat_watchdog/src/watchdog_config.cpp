#include "heartbeat_watchdog/watchdog_config.hpp"

namespace heartbeat_watchdog
{

namespace
{

bool fail(std::string * reason, const char * message)
{
  if (reason) {
    *reason = message;
  }
  return false;
}

}  // namespace

WatchdogConfig WatchdogConfig::from_period(Duration period)
{
  WatchdogConfig config;
  config.period = period;
  config.tolerance_low = period / 10;
  config.tolerance_high = period / 10;
  config.max_silence = period * 2;
  config.ordered = true;
  return config;
}

AcceptanceWindow WatchdogConfig::window() const
{
  return {period - tolerance_low, period + tolerance_high};
}

bool WatchdogConfig::validate(std::string * reason) const
{
  if (period <= Duration::zero()) {
    return fail(reason, "period must be positive");
  }
  if (tolerance_low < Duration::zero() || tolerance_high < Duration::zero()) {
    return fail(reason, "tolerances must not be negative");
  }
  if (tolerance_low > period) {
    return fail(reason, "tolerance_low must not exceed period");
  }
  if (max_silence < period + tolerance_high) {
    return fail(reason, "max_silence must be >= period + tolerance_high");
  }
  return true;
}

}  // namespace heartbeat_watchdog
