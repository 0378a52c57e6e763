#ifndef HEARTBEAT_WATCHDOG__VERDICT_HPP_
#define HEARTBEAT_WATCHDOG__VERDICT_HPP_

#include <cstdint>
#include <string>

#include "heartbeat_watchdog/types.hpp"
#include "heartbeat_watchdog/watchdog_config.hpp"

namespace heartbeat_watchdog
{

/// Detection outcome kinds. Closed set; transports never add to it.
enum class FaultKind : uint8_t
{
  NONE,
  TIMEOUT,       // no accepted beat for >= max_silence
  WINDOW,        // beat arrived outside the acceptance window
  OUT_OF_ORDER,  // beat polarity differs from the expected edge
};

/// Result of Watchdog::observe() / Watchdog::check().
///
/// A fault is a normal outcome describing degraded health, returned as a
/// value. Only the fields relevant to `kind` are meaningful:
///   TIMEOUT     : elapsed (silence)
///   WINDOW      : elapsed (inter-arrival time), expected
///   OUT_OF_ORDER: expected_edge, actual_edge
struct Verdict
{
  FaultKind kind{FaultKind::NONE};
  Duration elapsed{};
  AcceptanceWindow expected{};
  Edge expected_edge{Edge::RISING};
  Edge actual_edge{Edge::RISING};

  bool ok() const
  {
    return kind == FaultKind::NONE;
  }

  static Verdict healthy();
  static Verdict timeout(Duration since);
  static Verdict window(const AcceptanceWindow & expected, Duration actual);
  static Verdict out_of_order(Edge expected, Edge actual);
};

const char * to_string(FaultKind kind);

/// Human-readable one-line description, e.g. for logs and diagnostics
std::string describe(const Verdict & verdict);

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__VERDICT_HPP_
