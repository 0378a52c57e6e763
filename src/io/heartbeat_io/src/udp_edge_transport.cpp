#include "heartbeat_io/udp_edge_transport.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

#include "heartbeat_watchdog/io_error.hpp"

using heartbeat_watchdog::Beat;
using heartbeat_watchdog::Duration;
using heartbeat_watchdog::Edge;
using heartbeat_watchdog::IoErrc;

namespace heartbeat_io
{

namespace
{

std::error_code last_os_error()
{
  return {errno, std::system_category()};
}

bool would_block(int err)
{
  return err == EAGAIN || err == EWOULDBLOCK;
}

timespec to_timespec(Duration d)
{
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
  ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
  return ts;
}

}  // namespace

UdpEdgeTransport::UdpEdgeTransport() = default;

UdpEdgeTransport::~UdpEdgeTransport()
{
  close();
}

bool UdpEdgeTransport::open(const Config & config)
{
  close();

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_port = htons(config.bind_port);
  if (inet_pton(AF_INET, config.bind_address.c_str(), &local.sin_addr) != 1) {
    fprintf(stderr, "udp heartbeat: invalid bind address '%s'\n", config.bind_address.c_str());
    return false;
  }

  has_peer_ = false;
  if (!config.peer_address.empty()) {
    peer_ = sockaddr_in{};
    peer_.sin_family = AF_INET;
    peer_.sin_port = htons(config.peer_port);
    if (inet_pton(AF_INET, config.peer_address.c_str(), &peer_.sin_addr) != 1) {
      fprintf(stderr, "udp heartbeat: invalid peer address '%s'\n",
              config.peer_address.c_str());
      return false;
    }
    has_peer_ = true;
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    fprintf(stderr, "udp heartbeat: socket() failed: %s\n", strerror(errno));
    return false;
  }

  if (::bind(fd_, reinterpret_cast<const sockaddr *>(&local), sizeof(local)) < 0) {
    fprintf(stderr, "udp heartbeat: bind(%s:%u) failed: %s\n",
            config.bind_address.c_str(), config.bind_port, strerror(errno));
    close();
    return false;
  }

  return true;
}

void UdpEdgeTransport::close()
{
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool UdpEdgeTransport::is_open() const
{
  return fd_ >= 0;
}

uint16_t UdpEdgeTransport::local_port() const
{
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

std::error_code UdpEdgeTransport::send(Edge edge)
{
  if (fd_ < 0 || !has_peer_) {
    return make_error_code(IoErrc::NOT_OPEN);
  }

  const uint8_t symbol = heartbeat_watchdog::encode_edge(edge);
  const ssize_t n = ::sendto(fd_, &symbol, 1, MSG_DONTWAIT,
      reinterpret_cast<const sockaddr *>(&peer_), sizeof(peer_));
  if (n < 0) {
    return last_os_error();
  }
  return {};
}

std::error_code UdpEdgeTransport::recv_timeout(Duration timeout, std::optional<Beat> & beat)
{
  beat.reset();
  if (fd_ < 0) {
    return make_error_code(IoErrc::NOT_OPEN);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    Duration remaining = deadline - std::chrono::steady_clock::now();
    if (remaining < Duration::zero()) {
      remaining = Duration::zero();
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const timespec ts = to_timespec(remaining);
    const int rc = ::ppoll(&pfd, 1, &ts, nullptr);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return last_os_error();
    }
    if (rc == 0) {
      return {};  // nothing arrived
    }

    uint8_t buf[2];
    // MSG_TRUNC: report the real datagram length so oversized datagrams are caught
    const ssize_t n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT | MSG_TRUNC);
    if (n < 0) {
      if (would_block(errno) || errno == EINTR) {
        continue;
      }
      return last_os_error();
    }
    if (n == 0) {
      continue;  // empty datagram carries no edge
    }
    if (n != 1) {
      return make_error_code(IoErrc::INVALID_DATAGRAM);
    }

    const auto edge = heartbeat_watchdog::decode_edge(buf[0]);
    if (!edge) {
      return make_error_code(IoErrc::INVALID_SYMBOL);
    }
    beat = Beat{*edge, std::chrono::steady_clock::now()};
    return {};
  }
}

std::error_code UdpEdgeTransport::clear()
{
  if (fd_ < 0) {
    return make_error_code(IoErrc::NOT_OPEN);
  }

  uint8_t buf[1];
  for (;;) {
    const ssize_t n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
    if (n < 0) {
      if (would_block(errno)) {
        return {};
      }
      if (errno == EINTR) {
        continue;
      }
      return last_os_error();
    }
  }
}

}  // namespace heartbeat_io
