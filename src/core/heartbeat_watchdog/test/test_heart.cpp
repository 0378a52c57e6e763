/**
 * @file test_heart.cpp
 * @brief Unit tests for the heartbeat producer and the blocking clock.
 */

#include <assert.h>
#include <stdio.h>

#include <chrono>
#include <system_error>
#include <thread>

#include "heartbeat_watchdog/heart.hpp"
#include "heartbeat_watchdog/io_error.hpp"
#include "heartbeat_watchdog/sync/blocking_clock.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/recording_transport.hpp"

using namespace std::chrono_literals;
using heartbeat_watchdog::BlockingClock;
using heartbeat_watchdog::Edge;
using heartbeat_watchdog::Heart;
using heartbeat_watchdog::Instant;
using heartbeat_watchdog::IoErrc;
using heartbeat_watchdog::WatchdogConfig;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) do { \
    tests_run++; \
    printf("  [TEST] %-55s ", #name); \
    name(); \
    tests_passed++; \
    printf("PASS\n"); \
} while (0)

static void test_first_beat_sends_immediately()
{
  mocks::FakeClock clock;
  mocks::RecordingTransport transport;
  Heart<mocks::FakeClock> heart(100ms, transport, clock);

  assert(heart.next_edge() == Edge::RISING);
  assert(!heart.beat());
  assert(clock.sleeps.empty());
  assert(transport.sent.size() == 1);
  assert(transport.sent[0] == Edge::RISING);
  assert(heart.next_edge() == Edge::FALLING);
}

static void test_edges_alternate()
{
  mocks::FakeClock clock;
  mocks::RecordingTransport transport;
  Heart<mocks::FakeClock> heart(WatchdogConfig::from_period(50ms), transport, clock);

  for (int i = 0; i < 6; ++i) {
    assert(!heart.beat());
  }
  assert(transport.sent.size() == 6);
  for (size_t i = 0; i < transport.sent.size(); ++i) {
    assert(transport.sent[i] == (i % 2 == 0 ? Edge::RISING : Edge::FALLING));
  }
  assert(clock.now() == Instant(250ms));
}

static void test_wake_latency_does_not_accumulate()
{
  mocks::FakeClock clock;
  clock.latency = 3ms;
  mocks::RecordingTransport transport;
  transport.clock = [&clock] {return clock.now();};
  Heart<mocks::FakeClock> heart(100ms, transport, clock);

  for (int i = 0; i < 4; ++i) {
    assert(!heart.beat());
  }

  // Each wait is measured from the previous send, latency included once
  assert(clock.sleeps.size() == 3);
  assert(clock.sleeps[0] == Instant(100ms));
  assert(clock.sleeps[1] == Instant(203ms));
  assert(clock.sleeps[2] == Instant(306ms));
  assert(transport.sent_at[3] == Instant(309ms));
}

static void test_transport_error_advances_nothing()
{
  mocks::FakeClock clock;
  mocks::RecordingTransport transport;
  Heart<mocks::FakeClock> heart(100ms, transport, clock);

  const auto unreachable = std::make_error_code(std::errc::network_unreachable);
  transport.fail_next(1, unreachable);

  assert(heart.beat() == unreachable);
  assert(transport.sent.empty());
  assert(heart.next_edge() == Edge::RISING);
  assert(!heart.cadence().next_due());

  // Retry resends the same edge without waiting
  assert(!heart.beat());
  assert(clock.sleeps.empty());
  assert(transport.sent.size() == 1);
  assert(transport.sent[0] == Edge::RISING);
}

static void test_error_mid_stream_keeps_edge_and_reference()
{
  mocks::FakeClock clock;
  mocks::RecordingTransport transport;
  Heart<mocks::FakeClock> heart(100ms, transport, clock);

  assert(!heart.beat());
  transport.fail_next(1, std::make_error_code(std::errc::no_buffer_space));
  assert(heart.beat());
  assert(clock.now() == Instant(100ms));
  assert(heart.next_edge() == Edge::FALLING);

  assert(!heart.beat());
  assert(clock.now() == Instant(100ms));
  assert(transport.sent.size() == 2);
  assert(transport.sent[1] == Edge::FALLING);
  assert(transport.send_calls == 3);
}

static void test_interrupted_wait_is_cancelled()
{
  mocks::FakeClock clock;
  mocks::RecordingTransport transport;
  Heart<mocks::FakeClock> heart(100ms, transport, clock);

  assert(!heart.beat());
  clock.interrupted = true;
  const auto ec = heart.beat();
  assert(ec == IoErrc::CANCELLED);
  assert(transport.sent.size() == 1);
  assert(heart.next_edge() == Edge::FALLING);
}

static void test_blocking_clock_interrupt_and_reset()
{
  BlockingClock clock;
  assert(!clock.interrupted());
  assert(clock.sleep_until(clock.now() - 1ms));

  clock.interrupt();
  assert(clock.interrupted());
  assert(!clock.sleep_until(clock.now() + 10s));

  clock.reset();
  assert(!clock.interrupted());
  assert(clock.sleep_until(clock.now() + 1ms));
}

static void test_blocking_clock_interrupt_wakes_sleeper()
{
  BlockingClock clock;
  bool result = true;
  const auto start = std::chrono::steady_clock::now();

  std::thread sleeper([&] {result = clock.sleep_until(clock.now() + 10s);});
  std::this_thread::sleep_for(20ms);
  clock.interrupt();
  sleeper.join();

  assert(!result);
  assert(std::chrono::steady_clock::now() - start < 5s);
}

static void test_blocking_heart_keeps_period()
{
  BlockingClock clock;
  mocks::RecordingTransport transport;
  transport.clock = [] {return std::chrono::steady_clock::now();};
  Heart<> heart(20ms, transport, clock);

  for (int i = 0; i < 5; ++i) {
    assert(!heart.beat());
  }
  assert(transport.sent_at.size() == 5);
  for (size_t i = 1; i < transport.sent_at.size(); ++i) {
    assert(transport.sent_at[i] - transport.sent_at[i - 1] >= 20ms);
  }
}

static void test_blocking_heart_cancelled_by_interrupt()
{
  BlockingClock clock;
  mocks::RecordingTransport transport;
  Heart<> heart(10s, transport, clock);

  assert(!heart.beat());
  std::thread stopper([&clock] {
      std::this_thread::sleep_for(20ms);
      clock.interrupt();
    });
  assert(heart.beat() == IoErrc::CANCELLED);
  stopper.join();
  assert(transport.sent.size() == 1);
}

int main()
{
  printf("\n=== heart unit tests ===\n\n");

  TEST(test_first_beat_sends_immediately);
  TEST(test_edges_alternate);
  TEST(test_wake_latency_does_not_accumulate);

  printf("\n  --- errors ---\n");
  TEST(test_transport_error_advances_nothing);
  TEST(test_error_mid_stream_keeps_edge_and_reference);
  TEST(test_interrupted_wait_is_cancelled);

  printf("\n  --- blocking clock ---\n");
  TEST(test_blocking_clock_interrupt_and_reset);
  TEST(test_blocking_clock_interrupt_wakes_sleeper);
  TEST(test_blocking_heart_keeps_period);
  TEST(test_blocking_heart_cancelled_by_interrupt);

  printf("\n=== %d / %d tests passed ===\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
