#ifndef HEARTBEAT_IO__GPIO_EDGE_TRANSPORT_HPP_
#define HEARTBEAT_IO__GPIO_EDGE_TRANSPORT_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "heartbeat_watchdog/edge_transport.hpp"

namespace heartbeat_io
{

/// Heartbeat over a single GPIO line (Linux GPIO character device).
///
/// Output side: send() drives the line high for RISING and low for FALLING.
/// Input side: recv_timeout() samples the line every pull_interval and
/// reports a beat whenever the level differs from the last sample. The
/// polarity of the beat is the new level.
///
/// A pulse shorter than pull_interval may be missed; the watchdog then sees
/// silence or an out-of-order edge.
class GpioEdgeTransport : public heartbeat_watchdog::EdgeTransport
{
public:
  struct Config
  {
    std::string chip_path{"/dev/gpiochip0"};
    uint32_t line_offset{0};
    bool output{false};
    std::chrono::microseconds pull_interval{2000};
    std::string consumer{"heartbeat"};
  };

  GpioEdgeTransport();
  ~GpioEdgeTransport() override;

  // Non-copyable (owns the line handle)
  GpioEdgeTransport(const GpioEdgeTransport &) = delete;
  GpioEdgeTransport & operator=(const GpioEdgeTransport &) = delete;

  /// Request the line as input or output
  /// @return true on success
  bool open(const Config & config);

  void close();

  bool is_open() const;

  std::error_code send(heartbeat_watchdog::Edge edge) override;

  std::error_code recv_timeout(
    heartbeat_watchdog::Duration timeout,
    std::optional<heartbeat_watchdog::Beat> & beat) override;

  /// Resample the line so that a level change made during a pause is not
  /// reported as a fresh edge
  std::error_code clear() override;

private:
  std::error_code read_level(bool & level);

  int line_fd_{-1};
  Config config_{};
  bool last_level_{false};
};

}  // namespace heartbeat_io

#endif  // HEARTBEAT_IO__GPIO_EDGE_TRANSPORT_HPP_
