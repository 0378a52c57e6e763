#ifndef HEARTBEAT_WATCHDOG_NODES__HEART_NODE_HPP_
#define HEARTBEAT_WATCHDOG_NODES__HEART_NODE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "rclcpp/rclcpp.hpp"

#include "heartbeat_watchdog/edge_transport.hpp"
#include "heartbeat_watchdog/heart.hpp"
#include "heartbeat_watchdog/sync/blocking_clock.hpp"
#include "heartbeat_watchdog_nodes/transport_params.hpp"

namespace heartbeat_watchdog_nodes
{

/// Produces a heartbeat on a dedicated thread.
///
/// A failed send is logged and retried one period later; the edge is not
/// flipped until it has been sent.
class HeartNode : public rclcpp::Node
{
public:
  explicit HeartNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~HeartNode() override;

private:
  void beat_loop();
  void status_log_callback();

  rclcpp::TimerBase::SharedPtr status_timer_;

  heartbeat_watchdog::Duration period_{};
  TransportParams transport_params_{};

  std::unique_ptr<heartbeat_watchdog::EdgeTransport> transport_;
  heartbeat_watchdog::BlockingClock clock_;
  std::unique_ptr<heartbeat_watchdog::Heart<>> heart_;
  std::thread beat_thread_;

  std::atomic<uint64_t> beats_sent_{0};
  std::atomic<uint64_t> send_errors_{0};
};

}  // namespace heartbeat_watchdog_nodes

#endif  // HEARTBEAT_WATCHDOG_NODES__HEART_NODE_HPP_
