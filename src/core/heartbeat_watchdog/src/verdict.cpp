#include "heartbeat_watchdog/verdict.hpp"

#include <chrono>
#include <cstdio>

namespace heartbeat_watchdog
{

namespace
{

double to_ms(Duration d)
{
  return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

Verdict Verdict::healthy()
{
  return Verdict{};
}

Verdict Verdict::timeout(Duration since)
{
  Verdict verdict;
  verdict.kind = FaultKind::TIMEOUT;
  verdict.elapsed = since;
  return verdict;
}

Verdict Verdict::window(const AcceptanceWindow & expected, Duration actual)
{
  Verdict verdict;
  verdict.kind = FaultKind::WINDOW;
  verdict.elapsed = actual;
  verdict.expected = expected;
  return verdict;
}

Verdict Verdict::out_of_order(Edge expected, Edge actual)
{
  Verdict verdict;
  verdict.kind = FaultKind::OUT_OF_ORDER;
  verdict.expected_edge = expected;
  verdict.actual_edge = actual;
  return verdict;
}

const char * to_string(FaultKind kind)
{
  switch (kind) {
    case FaultKind::NONE:         return "NONE";
    case FaultKind::TIMEOUT:      return "TIMEOUT";
    case FaultKind::WINDOW:       return "WINDOW";
    case FaultKind::OUT_OF_ORDER: return "OUT_OF_ORDER";
  }
  return "UNKNOWN";
}

std::string describe(const Verdict & verdict)
{
  char buf[128];
  switch (verdict.kind) {
    case FaultKind::NONE:
      return "healthy";
    case FaultKind::TIMEOUT:
      std::snprintf(buf, sizeof(buf), "timeout: no accepted beat for %.3f ms",
                    to_ms(verdict.elapsed));
      return buf;
    case FaultKind::WINDOW:
      std::snprintf(buf, sizeof(buf), "window: beat after %.3f ms, expected [%.3f, %.3f] ms",
                    to_ms(verdict.elapsed), to_ms(verdict.expected.min),
                    to_ms(verdict.expected.max));
      return buf;
    case FaultKind::OUT_OF_ORDER:
      std::snprintf(buf, sizeof(buf), "out of order: expected %s edge, got %s",
                    to_string(verdict.expected_edge), to_string(verdict.actual_edge));
      return buf;
  }
  return "unknown";
}

}  // namespace heartbeat_watchdog
