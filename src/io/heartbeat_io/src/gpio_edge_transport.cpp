#include "heartbeat_io/gpio_edge_transport.hpp"

#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#include "heartbeat_watchdog/io_error.hpp"

using heartbeat_watchdog::Beat;
using heartbeat_watchdog::Duration;
using heartbeat_watchdog::Edge;
using heartbeat_watchdog::IoErrc;

namespace heartbeat_io
{

GpioEdgeTransport::GpioEdgeTransport() = default;

GpioEdgeTransport::~GpioEdgeTransport()
{
  close();
}

bool GpioEdgeTransport::open(const Config & config)
{
  close();
  config_ = config;

  const int chip_fd = ::open(config.chip_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (chip_fd < 0) {
    fprintf(stderr, "gpio heartbeat: cannot open %s: %s\n",
            config.chip_path.c_str(), strerror(errno));
    return false;
  }

  gpiohandle_request req{};
  req.lineoffsets[0] = config.line_offset;
  req.lines = 1;
  req.flags = config.output ? GPIOHANDLE_REQUEST_OUTPUT : GPIOHANDLE_REQUEST_INPUT;
  req.default_values[0] = 0;
  strncpy(req.consumer_label, config.consumer.c_str(), sizeof(req.consumer_label) - 1);

  const int rc = ::ioctl(chip_fd, GPIO_GET_LINEHANDLE_IOCTL, &req);
  const int err = errno;
  ::close(chip_fd);
  if (rc < 0) {
    fprintf(stderr, "gpio heartbeat: cannot request line %u on %s: %s\n",
            config.line_offset, config.chip_path.c_str(), strerror(err));
    return false;
  }
  line_fd_ = req.fd;

  if (!config.output) {
    if (auto ec = read_level(last_level_)) {
      fprintf(stderr, "gpio heartbeat: cannot read line %u: %s\n",
              config.line_offset, ec.message().c_str());
      close();
      return false;
    }
  }
  return true;
}

void GpioEdgeTransport::close()
{
  if (line_fd_ >= 0) {
    ::close(line_fd_);
    line_fd_ = -1;
  }
}

bool GpioEdgeTransport::is_open() const
{
  return line_fd_ >= 0;
}

std::error_code GpioEdgeTransport::send(Edge edge)
{
  if (line_fd_ < 0 || !config_.output) {
    return make_error_code(IoErrc::NOT_OPEN);
  }

  gpiohandle_data data{};
  data.values[0] = heartbeat_watchdog::level_from_edge(edge) ? 1 : 0;
  if (::ioctl(line_fd_, GPIOHANDLE_SET_LINE_VALUES_IOCTL, &data) < 0) {
    return {errno, std::system_category()};
  }
  return {};
}

std::error_code GpioEdgeTransport::recv_timeout(Duration timeout, std::optional<Beat> & beat)
{
  beat.reset();
  if (line_fd_ < 0 || config_.output) {
    return make_error_code(IoErrc::NOT_OPEN);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    bool level = last_level_;
    if (auto ec = read_level(level)) {
      return ec;
    }
    if (level != last_level_) {
      last_level_ = level;
      beat = Beat{heartbeat_watchdog::edge_from_level(level), std::chrono::steady_clock::now()};
      return {};
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return {};
    }
    const Duration step = std::min<Duration>(config_.pull_interval, deadline - now);
    std::this_thread::sleep_for(step);
  }
}

std::error_code GpioEdgeTransport::clear()
{
  if (line_fd_ < 0 || config_.output) {
    return make_error_code(IoErrc::NOT_OPEN);
  }
  return read_level(last_level_);
}

std::error_code GpioEdgeTransport::read_level(bool & level)
{
  gpiohandle_data data{};
  if (::ioctl(line_fd_, GPIOHANDLE_GET_LINE_VALUES_IOCTL, &data) < 0) {
    return {errno, std::system_category()};
  }
  level = data.values[0] != 0;
  return {};
}

}  // namespace heartbeat_io
