#ifndef HEARTBEAT_WATCHDOG__TYPES_HPP_
#define HEARTBEAT_WATCHDOG__TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <optional>

namespace heartbeat_watchdog
{

/// Monotonic time base shared by the blocking and cooperative clocks.
using Instant = std::chrono::steady_clock::time_point;
using Duration = Instant::duration;

/// Heartbeat edge polarity.
///
/// The enumerator value doubles as the wire symbol on byte-stream
/// transports: '+' for RISING, '.' for FALLING.
enum class Edge : uint8_t
{
  RISING = '+',
  FALLING = '.',
};

/// One observed heartbeat edge.
///
/// observed_at is assigned by the receiver at the moment of reception,
/// unless the transport itself is the authoritative clock.
struct Beat
{
  Edge edge{Edge::RISING};
  Instant observed_at{};
};

/// The other polarity
Edge opposite(Edge edge);

/// Wire symbol for an edge
uint8_t encode_edge(Edge edge);

/// Decode a wire symbol. Any byte other than '+' or '.' yields std::nullopt.
std::optional<Edge> decode_edge(uint8_t symbol);

/// Line level to edge (high = RISING)
Edge edge_from_level(bool level);

/// Edge to line level (RISING = high)
bool level_from_edge(Edge edge);

const char * to_string(Edge edge);

}  // namespace heartbeat_watchdog

#endif  // HEARTBEAT_WATCHDOG__TYPES_HPP_
