#include "heartbeat_watchdog/types.hpp"

namespace heartbeat_watchdog
{

Edge opposite(Edge edge)
{
  return edge == Edge::RISING ? Edge::FALLING : Edge::RISING;
}

uint8_t encode_edge(Edge edge)
{
  return static_cast<uint8_t>(edge);
}

std::optional<Edge> decode_edge(uint8_t symbol)
{
  switch (symbol) {
    case static_cast<uint8_t>(Edge::RISING):  return Edge::RISING;
    case static_cast<uint8_t>(Edge::FALLING): return Edge::FALLING;
    default:                                  return std::nullopt;
  }
}

Edge edge_from_level(bool level)
{
  return level ? Edge::RISING : Edge::FALLING;
}

bool level_from_edge(Edge edge)
{
  return edge == Edge::RISING;
}

const char * to_string(Edge edge)
{
  switch (edge) {
    case Edge::RISING:  return "RISING";
    case Edge::FALLING: return "FALLING";
  }
  return "UNKNOWN";
}

}  // namespace heartbeat_watchdog
