#ifndef HEARTBEAT_WATCHDOG_NODES__PARAM_RANGES_HPP_
#define HEARTBEAT_WATCHDOG_NODES__PARAM_RANGES_HPP_

#include <cstdint>
#include <limits>
#include <string>

namespace heartbeat_watchdog_nodes
{

/// Narrow an integer ROS parameter into T.
/// Returns false and leaves `out` untouched when `value` does not fit.
template<typename T>
bool narrow_parameter(int64_t value, T & out)
{
  if (value < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
    value > static_cast<int64_t>(std::numeric_limits<T>::max()))
  {
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

/// Message for a parameter outside [0, max of T]
template<typename T>
std::string range_error(const std::string & name, int64_t value)
{
  return name + " must be in [0, " +
         std::to_string(static_cast<uint64_t>(std::numeric_limits<T>::max())) + "] (got " +
         std::to_string(value) + ")";
}

}  // namespace heartbeat_watchdog_nodes

#endif  // HEARTBEAT_WATCHDOG_NODES__PARAM_RANGES_HPP_
