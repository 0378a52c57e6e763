#include "heartbeat_watchdog_nodes/heart_node.hpp"

#include <chrono>
#include <functional>

#include "heartbeat_watchdog/io_error.hpp"

using namespace std::chrono_literals;

namespace heartbeat_watchdog_nodes
{

HeartNode::HeartNode(const rclcpp::NodeOptions & options)
: Node("heart", options)
{
  const auto period_ms = declare_parameter<int>("period_ms", 100);
  transport_params_ = declare_transport_parameters(*this, LinkRole::SENDER);

  if (period_ms <= 0) {
    RCLCPP_FATAL(get_logger(), "period_ms must be positive (got %d)", period_ms);
    rclcpp::shutdown();
    return;
  }
  period_ = std::chrono::milliseconds(period_ms);

  transport_ = open_transport(transport_params_, get_logger());
  if (!transport_) {
    RCLCPP_FATAL(get_logger(), "No heartbeat transport. Shutting down.");
    rclcpp::shutdown();
    return;
  }

  heart_ = std::make_unique<heartbeat_watchdog::Heart<>>(period_, *transport_, clock_);
  beat_thread_ = std::thread(&HeartNode::beat_loop, this);

  status_timer_ = create_wall_timer(10s,
    std::bind(&HeartNode::status_log_callback, this));

  RCLCPP_INFO(get_logger(), "Heart started on %s, period %d ms",
    describe(transport_params_).c_str(), period_ms);
}

HeartNode::~HeartNode()
{
  clock_.interrupt();
  if (beat_thread_.joinable()) {
    beat_thread_.join();
  }
  RCLCPP_INFO(get_logger(), "Heart stopped after %lu beats",
    static_cast<unsigned long>(beats_sent_.load()));
}

void HeartNode::beat_loop()
{
  for (;;) {
    const auto ec = heart_->beat();
    if (!ec) {
      beats_sent_++;
      continue;
    }
    if (ec == heartbeat_watchdog::IoErrc::CANCELLED) {
      return;
    }

    send_errors_++;
    RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000,
      "Heartbeat send failed (%s edge): %s",
      heartbeat_watchdog::to_string(heart_->next_edge()), ec.message().c_str());

    // Retry the same edge one period later
    if (!clock_.sleep_until(clock_.now() + period_)) {
      return;
    }
  }
}

void HeartNode::status_log_callback()
{
  RCLCPP_INFO(get_logger(), "Beats sent: %lu, send errors: %lu",
    static_cast<unsigned long>(beats_sent_.load()),
    static_cast<unsigned long>(send_errors_.load()));
}

}  // namespace heartbeat_watchdog_nodes

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<heartbeat_watchdog_nodes::HeartNode>();
  if (rclcpp::ok()) {
    rclcpp::spin(node);
  }
  rclcpp::shutdown();
  return 0;
}
