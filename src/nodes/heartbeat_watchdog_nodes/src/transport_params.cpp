#include "heartbeat_watchdog_nodes/transport_params.hpp"

#include <chrono>

#include "heartbeat_watchdog_nodes/param_ranges.hpp"

namespace heartbeat_watchdog_nodes
{

TransportParams declare_transport_parameters(rclcpp::Node & node, LinkRole role)
{
  const bool sender = role == LinkRole::SENDER;
  TransportParams params;

  params.kind = node.declare_parameter<std::string>("transport", "udp");

  params.udp.bind_address = node.declare_parameter<std::string>("udp.bind_address", "0.0.0.0");
  const auto bind_port = node.declare_parameter<int64_t>("udp.bind_port", sender ? 0 : 9999);
  if (!narrow_parameter(bind_port, params.udp.bind_port) && params.error.empty()) {
    params.error = range_error<uint16_t>("udp.bind_port", bind_port);
  }
  if (sender) {
    params.udp.peer_address = node.declare_parameter<std::string>("udp.peer_address", "127.0.0.1");
    const auto peer_port = node.declare_parameter<int64_t>("udp.peer_port", 9999);
    if (!narrow_parameter(peer_port, params.udp.peer_port) && params.error.empty()) {
      params.error = range_error<uint16_t>("udp.peer_port", peer_port);
    }
  }

  params.gpio.chip_path = node.declare_parameter<std::string>("gpio.chip", "/dev/gpiochip0");
  const auto line = node.declare_parameter<int64_t>("gpio.line", 0);
  if (!narrow_parameter(line, params.gpio.line_offset) && params.error.empty()) {
    params.error = range_error<uint32_t>("gpio.line", line);
  }
  params.gpio.output = sender;
  params.gpio.consumer = node.get_name();
  if (!sender) {
    params.gpio.pull_interval = std::chrono::microseconds(
      node.declare_parameter<int>("gpio.pull_interval_us", 2000));
  }
  return params;
}

std::unique_ptr<heartbeat_watchdog::EdgeTransport> open_transport(
  const TransportParams & params, const rclcpp::Logger & logger)
{
  if (!params.error.empty()) {
    RCLCPP_ERROR(logger, "Invalid transport parameters: %s", params.error.c_str());
    return nullptr;
  }

  if (params.kind == "udp") {
    auto udp = std::make_unique<heartbeat_io::UdpEdgeTransport>();
    if (!udp->open(params.udp)) {
      RCLCPP_ERROR(logger, "Failed to open UDP transport (%s)", describe(params).c_str());
      return nullptr;
    }
    return udp;
  }

  if (params.kind == "gpio") {
    if (!params.gpio.output && params.gpio.pull_interval <= std::chrono::microseconds::zero()) {
      RCLCPP_ERROR(logger, "gpio.pull_interval_us must be positive");
      return nullptr;
    }
    auto gpio = std::make_unique<heartbeat_io::GpioEdgeTransport>();
    if (!gpio->open(params.gpio)) {
      RCLCPP_ERROR(logger, "Failed to open GPIO transport (%s)", describe(params).c_str());
      return nullptr;
    }
    return gpio;
  }

  RCLCPP_ERROR(logger, "Unknown transport '%s' (expected udp or gpio)", params.kind.c_str());
  return nullptr;
}

std::string describe(const TransportParams & params)
{
  if (params.kind == "gpio") {
    return "gpio " + params.gpio.chip_path + " line " + std::to_string(params.gpio.line_offset) +
           (params.gpio.output ? " out" : " in");
  }
  std::string text = "udp " + params.udp.bind_address + ":" + std::to_string(params.udp.bind_port);
  if (!params.udp.peer_address.empty()) {
    text += " -> " + params.udp.peer_address + ":" + std::to_string(params.udp.peer_port);
  }
  return text;
}

}  // namespace heartbeat_watchdog_nodes
