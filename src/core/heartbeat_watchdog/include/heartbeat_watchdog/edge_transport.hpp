#ifndef HEARTBEAT_WATCHDOG__EDGE_TRANSPORT_HPP_
#define HEARTBEAT_WATCHDOG__EDGE_TRANSPORT_HPP_

#include <optional>
#include <system_error>

#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

/// Contract a heartbeat transport satisfies to carry edges from a Heart to
/// a Watchdog. Concrete transports (UDP, GPIO, ...) live outside the core
/// and implement this interface directly.
///
/// Errors are returned unchanged to the caller. Absence of an edge is not an
/// error at this layer; it is the Watchdog's concern.
class EdgeTransport
{
public:
  virtual ~EdgeTransport() = default;

  /// Transmit one edge. Must return within a bounded, implementation-declared time.
  virtual std::error_code send(Edge edge) = 0;

  /// Wait up to `timeout` for the next edge.
  /// On success `beat` holds the edge, or is empty if nothing arrived in time.
  /// A zero timeout polls without blocking.
  virtual std::error_code recv_timeout(Duration timeout, std::optional<Beat> & beat) = 0;

  /// Drop anything already queued (stale edges after a pause)
  virtual std::error_code clear()
  {
    return {};
  }

  /// true if Beat::observed_at is an authoritative timestamp (e.g. hardware
  /// edge capture). Otherwise receivers re-stamp beats with their own clock.
  virtual bool stamps_beats() const
  {
    return false;
  }
};

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__EDGE_TRANSPORT_HPP_
