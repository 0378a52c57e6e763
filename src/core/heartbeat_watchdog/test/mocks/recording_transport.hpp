#ifndef HEARTBEAT_WATCHDOG__TEST__MOCKS__RECORDING_TRANSPORT_HPP_
#define HEARTBEAT_WATCHDOG__TEST__MOCKS__RECORDING_TRANSPORT_HPP_

#include <functional>
#include <optional>
#include <system_error>
#include <vector>

#include "heartbeat_watchdog/edge_transport.hpp"

namespace mocks
{

/// Send-only transport that records every edge and can be told to fail.
///
/// If `clock` is set, the send instant of each edge is recorded too.
class RecordingTransport : public heartbeat_watchdog::EdgeTransport
{
public:
  std::error_code send(heartbeat_watchdog::Edge edge) override
  {
    send_calls++;
    if (fail_count > 0) {
      fail_count--;
      return fail_with;
    }
    sent.push_back(edge);
    if (clock) {
      sent_at.push_back(clock());
    }
    return {};
  }

  std::error_code recv_timeout(
    heartbeat_watchdog::Duration /*timeout*/,
    std::optional<heartbeat_watchdog::Beat> & beat) override
  {
    beat.reset();
    return {};
  }

  /// Fail the next `count` sends with `ec`
  void fail_next(int count, std::error_code ec)
  {
    fail_count = count;
    fail_with = ec;
  }

  std::vector<heartbeat_watchdog::Edge> sent;
  std::vector<heartbeat_watchdog::Instant> sent_at;
  std::function<heartbeat_watchdog::Instant()> clock;
  int send_calls{0};
  int fail_count{0};
  std::error_code fail_with{};
};

}  // namespace mocks

#endif  // HEARTBEAT_WATCHDOG__TEST__MOCKS__RECORDING_TRANSPORT_HPP_
