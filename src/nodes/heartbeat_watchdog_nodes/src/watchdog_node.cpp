#include "heartbeat_watchdog_nodes/watchdog_node.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>

#include "heartbeat_watchdog/verdict.hpp"

using heartbeat_watchdog::HealthState;
using heartbeat_watchdog::StateEvent;

namespace heartbeat_watchdog_nodes
{

namespace
{

diagnostic_msgs::msg::KeyValue key_value(const std::string & key, const std::string & value)
{
  diagnostic_msgs::msg::KeyValue kv;
  kv.key = key;
  kv.value = value;
  return kv;
}

double to_ms(heartbeat_watchdog::Duration d)
{
  return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

WatchdogNode::WatchdogNode(const rclcpp::NodeOptions & options)
: Node("heartbeat_watchdog", options)
{
  if (!load_parameters()) {
    rclcpp::shutdown();
    return;
  }

  try {
    watchdog_ = std::make_unique<heartbeat_watchdog::Watchdog>(watchdog_config_);
  } catch (const std::invalid_argument & e) {
    RCLCPP_FATAL(get_logger(), "%s", e.what());
    rclcpp::shutdown();
    return;
  }

  transport_ = open_transport(transport_params_, get_logger());
  if (!transport_) {
    RCLCPP_FATAL(get_logger(), "No heartbeat transport. Shutting down.");
    rclcpp::shutdown();
    return;
  }

  // Create publishers
  healthy_pub_ = create_publisher<std_msgs::msg::Bool>("~/healthy", 10);
  diagnostics_pub_ = create_publisher<diagnostic_msgs::msg::DiagnosticArray>("/diagnostics", 10);

  // Create services
  arm_service_ = create_service<std_srvs::srv::Trigger>("~/arm",
    std::bind(&WatchdogNode::arm_callback, this, std::placeholders::_1, std::placeholders::_2));
  disarm_service_ = create_service<std_srvs::srv::Trigger>("~/disarm",
    std::bind(&WatchdogNode::disarm_callback, this, std::placeholders::_1, std::placeholders::_2));

  runner_ = std::make_unique<heartbeat_watchdog::WatchdogRunner>(
    *watchdog_, *transport_, runner_config_);
  runner_->tracker().set_listener(
    std::bind(&WatchdogNode::on_state_event, this, std::placeholders::_1));
  runner_->start();

  auto status_period = std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::duration<double>(1.0 / status_rate_hz_));
  status_timer_ = create_wall_timer(status_period,
    std::bind(&WatchdogNode::status_timer_callback, this));

  RCLCPP_INFO(get_logger(),
    "Watchdog started on %s: period %.1f ms, window [%.1f, %.1f] ms, max silence %.1f ms, %s",
    describe(transport_params_).c_str(),
    to_ms(watchdog_config_.period),
    to_ms(watchdog_config_.window().min), to_ms(watchdog_config_.window().max),
    to_ms(watchdog_config_.max_silence),
    watchdog_config_.ordered ? "ordered" : "unordered");
}

WatchdogNode::~WatchdogNode()
{
  if (runner_) {
    runner_->stop();
  }
}

bool WatchdogNode::load_parameters()
{
  const auto period_ms = declare_parameter<int>("period_ms", 100);
  const auto tolerance_low_ms = declare_parameter<int>("tolerance_low_ms", 10);
  const auto tolerance_high_ms = declare_parameter<int>("tolerance_high_ms", 10);
  const auto max_silence_ms = declare_parameter<int>("max_silence_ms", 200);
  const auto ordered = declare_parameter<bool>("ordered", true);
  const auto min_beats = declare_parameter<int>("min_beats", 2);
  const auto warmup_ms = declare_parameter<int>("warmup_ms", 200);
  const auto poll_interval_ms = declare_parameter<int>("poll_interval_ms", 10);
  status_rate_hz_ = declare_parameter<double>("status_rate_hz", 10.0);
  transport_params_ = declare_transport_parameters(*this, LinkRole::RECEIVER);

  watchdog_config_.period = std::chrono::milliseconds(period_ms);
  watchdog_config_.tolerance_low = std::chrono::milliseconds(tolerance_low_ms);
  watchdog_config_.tolerance_high = std::chrono::milliseconds(tolerance_high_ms);
  watchdog_config_.max_silence = std::chrono::milliseconds(max_silence_ms);
  watchdog_config_.ordered = ordered;

  std::string reason;
  if (!watchdog_config_.validate(&reason)) {
    RCLCPP_FATAL(get_logger(), "Invalid watchdog parameters: %s", reason.c_str());
    return false;
  }
  if (min_beats < 1 || warmup_ms < 0 || poll_interval_ms <= 0 || status_rate_hz_ <= 0.0) {
    RCLCPP_FATAL(get_logger(),
      "Invalid runner parameters: min_beats >= 1, warmup_ms >= 0, "
      "poll_interval_ms > 0 and status_rate_hz > 0 required");
    return false;
  }

  runner_config_.min_beats = static_cast<uint32_t>(min_beats);
  runner_config_.warmup = std::chrono::milliseconds(warmup_ms);
  runner_config_.poll_interval = std::chrono::milliseconds(poll_interval_ms);
  return true;
}

void WatchdogNode::on_state_event(const StateEvent & event)
{
  // Runs on the runner thread
  if (event.state == HealthState::OK) {
    RCLCPP_INFO(get_logger(), "Heartbeat OK (recovered from %s)",
      heartbeat_watchdog::to_string(event.reason));
  } else if (event.reason == heartbeat_watchdog::FaultReason::INITIAL) {
    RCLCPP_INFO(get_logger(), "Waiting for heartbeat");
  } else {
    RCLCPP_WARN(get_logger(), "Heartbeat FAULT: %s",
      heartbeat_watchdog::describe(event.verdict).c_str());
  }

  if (healthy_pub_) {
    std_msgs::msg::Bool msg;
    msg.data = event.state == HealthState::OK;
    healthy_pub_->publish(msg);
  }
}

void WatchdogNode::status_timer_callback()
{
  std_msgs::msg::Bool msg;
  msg.data = runner_->tracker().is_ok();
  healthy_pub_->publish(msg);

  publish_diagnostics();

  if (!runner_->running() && !runner_failure_reported_) {
    const auto ec = runner_->last_error();
    if (ec) {
      RCLCPP_ERROR(get_logger(), "Receiver stopped on transport error: %s",
        ec.message().c_str());
    } else {
      RCLCPP_WARN(get_logger(), "Receiver stopped");
    }
    runner_failure_reported_ = true;
  }
}

void WatchdogNode::publish_diagnostics()
{
  using diagnostic_msgs::msg::DiagnosticStatus;

  const auto & tracker = runner_->tracker();
  const StateEvent last = tracker.last_event();
  const bool armed = watchdog_->is_armed();
  const bool receiving = runner_->running();

  DiagnosticStatus status;
  status.name = std::string(get_name()) + ": heartbeat";
  status.hardware_id = describe(transport_params_);

  if (!receiving) {
    status.level = DiagnosticStatus::ERROR;
    status.message = "receiver stopped";
  } else if (!armed) {
    status.level = DiagnosticStatus::WARN;
    status.message = "disarmed";
  } else if (tracker.is_ok()) {
    status.level = DiagnosticStatus::OK;
    status.message = "healthy";
  } else {
    status.level = DiagnosticStatus::ERROR;
    status.message = std::string("fault: ") + heartbeat_watchdog::to_string(last.reason);
  }

  status.values.push_back(key_value("state", heartbeat_watchdog::to_string(tracker.state())));
  status.values.push_back(key_value("reason", heartbeat_watchdog::to_string(last.reason)));
  status.values.push_back(key_value("last_verdict", heartbeat_watchdog::describe(last.verdict)));
  status.values.push_back(key_value("armed", armed ? "true" : "false"));
  status.values.push_back(key_value("healthy_streak", std::to_string(tracker.healthy_streak())));
  status.values.push_back(key_value("expected_edge",
    heartbeat_watchdog::to_string(watchdog_->expected_edge())));
  if (armed) {
    const auto silence = std::chrono::steady_clock::now() - watchdog_->last_accepted();
    status.values.push_back(key_value("silence_ms", std::to_string(to_ms(silence))));
  }

  diagnostic_msgs::msg::DiagnosticArray array;
  array.header.stamp = now();
  array.status.push_back(status);
  diagnostics_pub_->publish(array);
}

void WatchdogNode::arm_callback(
  const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  watchdog_->arm(std::chrono::steady_clock::now());
  RCLCPP_INFO(get_logger(), "Watchdog armed");
  response->success = true;
  response->message = "armed";
}

void WatchdogNode::disarm_callback(
  const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  watchdog_->disarm();
  RCLCPP_INFO(get_logger(), "Watchdog disarmed");
  response->success = true;
  response->message = "disarmed";
}

}  // namespace heartbeat_watchdog_nodes

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<heartbeat_watchdog_nodes::WatchdogNode>();
  if (rclcpp::ok()) {
    rclcpp::spin(node);
  }
  rclcpp::shutdown();
  return 0;
}
