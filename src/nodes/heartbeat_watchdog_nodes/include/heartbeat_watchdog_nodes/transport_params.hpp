#ifndef HEARTBEAT_WATCHDOG_NODES__TRANSPORT_PARAMS_HPP_
#define HEARTBEAT_WATCHDOG_NODES__TRANSPORT_PARAMS_HPP_

#include <memory>
#include <string>

#include "rclcpp/rclcpp.hpp"

#include "heartbeat_io/gpio_edge_transport.hpp"
#include "heartbeat_io/udp_edge_transport.hpp"
#include "heartbeat_watchdog/edge_transport.hpp"

namespace heartbeat_watchdog_nodes
{

/// Which end of the link a node sits on
enum class LinkRole
{
  SENDER,
  RECEIVER,
};

/// Transport selection shared by the heart and watchdog nodes.
///
/// Parameters:
///   transport            "udp" | "gpio"
///   udp.bind_address     local address
///   udp.bind_port        local port (receiver default 9999, sender 0)
///   udp.peer_address     sender only
///   udp.peer_port        sender only
///   gpio.chip            e.g. /dev/gpiochip0
///   gpio.line            line offset on the chip
///   gpio.pull_interval_us  receiver sampling period
struct TransportParams
{
  std::string kind{"udp"};
  heartbeat_io::UdpEdgeTransport::Config udp{};
  heartbeat_io::GpioEdgeTransport::Config gpio{};
  std::string error;  // first out-of-range parameter, empty when valid
};

TransportParams declare_transport_parameters(rclcpp::Node & node, LinkRole role);

/// Open the selected transport. Logs and returns nullptr on failure,
/// including when declaring the parameters recorded an error.
std::unique_ptr<heartbeat_watchdog::EdgeTransport> open_transport(
  const TransportParams & params, const rclcpp::Logger & logger);

/// One-line description for startup logs
std::string describe(const TransportParams & params);

}  // namespace heartbeat_watchdog_nodes

#endif  // HEARTBEAT_WATCHDOG_NODES__TRANSPORT_PARAMS_HPP_
