#ifndef HEARTBEAT_IO__UDP_EDGE_TRANSPORT_HPP_
#define HEARTBEAT_IO__UDP_EDGE_TRANSPORT_HPP_

#include <netinet/in.h>

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "heartbeat_watchdog/edge_transport.hpp"

namespace heartbeat_io
{

/// Heartbeat over UDP datagrams.
///
/// Wire format: one datagram per beat carrying exactly one byte,
/// '+' (RISING) or '.' (FALLING). Lost datagrams surface to the watchdog
/// only as silence.
///
/// The same class serves both ends:
///   - heart side:    set peer_address/peer_port, then send()
///   - watchdog side: set bind_port, then recv_timeout()
///
/// send() never blocks past one non-blocking sendto() call.
class UdpEdgeTransport : public heartbeat_watchdog::EdgeTransport
{
public:
  struct Config
  {
    std::string bind_address{"0.0.0.0"};
    uint16_t bind_port{0};         // 0 = ephemeral
    std::string peer_address{};    // empty = receive only
    uint16_t peer_port{0};
  };

  UdpEdgeTransport();
  ~UdpEdgeTransport() override;

  // Non-copyable (owns a socket)
  UdpEdgeTransport(const UdpEdgeTransport &) = delete;
  UdpEdgeTransport & operator=(const UdpEdgeTransport &) = delete;

  /// Create and bind the socket, resolve the peer if configured
  /// @return true on success
  bool open(const Config & config);

  void close();

  bool is_open() const;

  /// Bound port (useful with bind_port = 0)
  uint16_t local_port() const;

  std::error_code send(heartbeat_watchdog::Edge edge) override;

  std::error_code recv_timeout(
    heartbeat_watchdog::Duration timeout,
    std::optional<heartbeat_watchdog::Beat> & beat) override;

  /// Drain queued datagrams
  std::error_code clear() override;

private:
  int fd_{-1};
  bool has_peer_{false};
  sockaddr_in peer_{};
};

}  // namespace heartbeat_io

#endif  // HEARTBEAT_IO__UDP_EDGE_TRANSPORT_HPP_
