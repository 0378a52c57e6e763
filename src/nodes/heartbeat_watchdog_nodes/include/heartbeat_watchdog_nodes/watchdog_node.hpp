#ifndef HEARTBEAT_WATCHDOG_NODES__WATCHDOG_NODE_HPP_
#define HEARTBEAT_WATCHDOG_NODES__WATCHDOG_NODE_HPP_

#include <memory>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/bool.hpp"
#include "std_srvs/srv/trigger.hpp"
#include "diagnostic_msgs/msg/diagnostic_array.hpp"

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/health_tracker.hpp"
#include "heartbeat_watchdog/runner_config.hpp"
#include "heartbeat_watchdog/watchdog.hpp"
#include "heartbeat_watchdog/watchdog_runner.hpp"
#include "heartbeat_watchdog_nodes/transport_params.hpp"

namespace heartbeat_watchdog_nodes
{

/// Monitors a remote heart over UDP or GPIO.
///
/// Publishes:
///   - ~/healthy (std_msgs/Bool): true while the tracker is OK
///   - /diagnostics (diagnostic_msgs/DiagnosticArray): state, reason, last verdict
///
/// Services:
///   - ~/arm (std_srvs/Trigger): resume monitoring, silence clock restarts now
///   - ~/disarm (std_srvs/Trigger): pause monitoring, edges are drained unjudged
///
/// Detection runs on the WatchdogRunner thread; the status timer only reads
/// the tracker.
class WatchdogNode : public rclcpp::Node
{
public:
  explicit WatchdogNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~WatchdogNode() override;

private:
  bool load_parameters();
  void on_state_event(const heartbeat_watchdog::StateEvent & event);
  void status_timer_callback();
  void publish_diagnostics();

  void arm_callback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void disarm_callback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  // Publishers
  rclcpp::Publisher<std_msgs::msg::Bool>::SharedPtr healthy_pub_;
  rclcpp::Publisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diagnostics_pub_;

  // Services
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr arm_service_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr disarm_service_;

  rclcpp::TimerBase::SharedPtr status_timer_;

  // Parameters
  heartbeat_watchdog::WatchdogConfig watchdog_config_{};
  heartbeat_watchdog::RunnerConfig runner_config_{};
  TransportParams transport_params_{};
  double status_rate_hz_{10.0};

  // Detection
  std::unique_ptr<heartbeat_watchdog::Watchdog> watchdog_;
  std::unique_ptr<heartbeat_watchdog::EdgeTransport> transport_;
  std::unique_ptr<heartbeat_watchdog::WatchdogRunner> runner_;

  bool runner_failure_reported_{false};
};

}  // namespace heartbeat_watchdog_nodes

#endif  // HEARTBEAT_WATCHDOG_NODES__WATCHDOG_NODE_HPP_
