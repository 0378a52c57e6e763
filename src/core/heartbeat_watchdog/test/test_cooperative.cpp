/**
 * @file test_cooperative.cpp
 * @brief Unit tests for the cooperative clock, executor, HeartTask and WatchdogTask.
 *
 * Time is simulated: the executor's idle hook advances the tick clock, so
 * every run is deterministic.
 */

#include <assert.h>
#include <stdio.h>

#include <chrono>
#include <functional>
#include <system_error>
#include <vector>

#include "heartbeat_watchdog/heart_task.hpp"
#include "heartbeat_watchdog/sync/cooperative_clock.hpp"
#include "heartbeat_watchdog/sync/cooperative_executor.hpp"
#include "heartbeat_watchdog/watchdog.hpp"
#include "heartbeat_watchdog/watchdog_task.hpp"
#include "mocks/loopback_transport.hpp"
#include "mocks/recording_transport.hpp"

using namespace std::chrono_literals;
using heartbeat_watchdog::Beat;
using heartbeat_watchdog::CooperativeClock;
using heartbeat_watchdog::CooperativeExecutor;
using heartbeat_watchdog::CooperativeTask;
using heartbeat_watchdog::Duration;
using heartbeat_watchdog::Edge;
using heartbeat_watchdog::FaultReason;
using heartbeat_watchdog::HealthState;
using heartbeat_watchdog::HeartTask;
using heartbeat_watchdog::Instant;
using heartbeat_watchdog::RunnerConfig;
using heartbeat_watchdog::StateEvent;
using heartbeat_watchdog::Watchdog;
using heartbeat_watchdog::WatchdogConfig;
using heartbeat_watchdog::WatchdogTask;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) do { \
    tests_run++; \
    printf("  [TEST] %-55s ", #name); \
    name(); \
    tests_passed++; \
    printf("PASS\n"); \
} while (0)

/// Wakes every `interval`, records when it ran
class IntervalTask : public CooperativeTask
{
public:
  explicit IntervalTask(Duration interval)
  : interval_(interval)
  {
  }

  Instant poll(Instant now) override
  {
    polls.push_back(now);
    if (on_poll) {
      on_poll();
    }
    return now + interval_;
  }

  std::vector<Instant> polls;
  std::function<void()> on_poll;

private:
  Duration interval_;
};

static Instant at(Duration t)
{
  return Instant(t);
}

// period 10 ms, window [9, 11] ms, max silence 20 ms
static WatchdogConfig make_config()
{
  WatchdogConfig cfg;
  cfg.period = 10ms;
  cfg.tolerance_low = 1ms;
  cfg.tolerance_high = 1ms;
  cfg.max_silence = 20ms;
  return cfg;
}

static RunnerConfig make_runner_config()
{
  RunnerConfig cfg;
  cfg.poll_interval = 1ms;
  cfg.warmup = 5ms;
  cfg.min_beats = 2;
  return cfg;
}

static void deliver(mocks::LoopbackTransport & link, Edge edge)
{
  link.push(Beat{edge, Instant{}});
}

/// Drive a receiver from warm-up to OK by polling it directly:
/// armed at 5 ms, resync at 6 ms, judged beats at 16 and 26 ms
static void bring_up(WatchdogTask & receiver, mocks::LoopbackTransport & link)
{
  receiver.poll(at(0ms));
  receiver.poll(at(5ms));
  deliver(link, Edge::RISING);
  receiver.poll(at(6ms));
  deliver(link, Edge::FALLING);
  receiver.poll(at(16ms));
  deliver(link, Edge::RISING);
  receiver.poll(at(26ms));
  assert(receiver.tracker().is_ok());
}

static void test_clock_ticks()
{
  CooperativeClock clock(1ms);
  assert(clock.now() == Instant{});
  assert(clock.await_until(Instant{}));
  assert(!clock.await_until(at(1ms)));

  clock.tick();
  assert(clock.now() == at(1ms));
  assert(clock.await_until(at(1ms)));

  clock.advance(9);
  assert(clock.ticks() == 10);
  assert(clock.now() == at(10ms));
  assert(clock.tick_period() == 1ms);
}

static void test_executor_polls_due_tasks_in_spawn_order()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  std::vector<int> order;
  IntervalTask a(2ms);
  IntervalTask b(3ms);
  a.on_poll = [&order] {order.push_back(1);};
  b.on_poll = [&order] {order.push_back(2);};

  executor.spawn(a);
  executor.spawn(b);
  assert(executor.task_count() == 2);

  assert(executor.run_once() == 2);
  assert(order.size() == 2 && order[0] == 1 && order[1] == 2);
  assert(executor.next_wake() == at(2ms));

  // Nothing due yet
  assert(executor.run_once() == 0);

  executor.run_until(at(6ms), [&clock] {clock.tick();});
  // a: 0, 2, 4, 6   b: 0, 3, 6
  assert(a.polls.size() == 4);
  assert(b.polls.size() == 3);
  assert(b.polls[1] == at(3ms));
}

static void test_executor_cancel_from_inside_poll()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  IntervalTask a(1ms);
  IntervalTask b(1ms);
  a.on_poll = [&executor, &b] {executor.cancel(b);};

  executor.spawn(a);
  executor.spawn(b);
  assert(executor.run_once() == 1);
  assert(b.polls.empty());
  assert(executor.task_count() == 1);
  assert(!executor.cancel(b));

  assert(executor.cancel(a));
  assert(executor.task_count() == 0);
  assert(!executor.next_wake());
}

static void test_heart_task_cadence()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  mocks::RecordingTransport transport;
  transport.clock = [&clock] {return clock.now();};
  HeartTask heart(10ms, transport);

  executor.spawn(heart);
  executor.run_until(at(35ms), [&clock] {clock.tick();});

  assert(heart.beats_sent() == 4);
  assert(transport.sent.size() == 4);
  assert(transport.sent[0] == Edge::RISING);
  assert(transport.sent[1] == Edge::FALLING);
  assert(transport.sent_at[3] == at(30ms));
  assert(heart.error_count() == 0);
  assert(!heart.last_error());
}

static void test_heart_task_retries_failed_send()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  mocks::RecordingTransport transport;
  transport.clock = [&clock] {return clock.now();};
  HeartTask heart(10ms, transport);

  transport.fail_next(2, std::make_error_code(std::errc::no_buffer_space));
  executor.spawn(heart);

  executor.run_once();
  assert(heart.error_count() == 1);
  assert(heart.last_error() == std::errc::no_buffer_space);
  assert(transport.sent.empty());

  executor.run_until(at(2ms), [&clock] {clock.tick();});
  assert(heart.error_count() == 2);
  assert(heart.beats_sent() == 1);
  assert(transport.sent[0] == Edge::RISING);
  assert(!heart.last_error());
  assert(heart.cadence().next_due() == at(11ms));
}

static void test_watchdog_task_detects_loss_and_recovery()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  mocks::LoopbackTransport link;
  auto tick = [&clock] {clock.tick();};

  Watchdog watchdog(make_config());
  WatchdogTask receiver(watchdog, link, make_runner_config());
  HeartTask heart(10ms, link);

  std::vector<StateEvent> events;
  receiver.tracker().set_listener([&events](const StateEvent & e) {events.push_back(e);});

  executor.spawn(heart);
  executor.spawn(receiver);

  // Warm-up, one resync edge, then two judged beats
  executor.run_until(at(100ms), tick);
  assert(watchdog.is_armed());
  assert(receiver.tracker().is_ok());
  assert(receiver.error_count() == 0);
  assert(events.size() == 2);
  assert(events[0].reason == FaultReason::INITIAL);
  assert(events[1].state == HealthState::OK);

  // Heart stops: TIMEOUT once max_silence has passed
  executor.cancel(heart);
  executor.run_until(at(200ms), tick);
  assert(!receiver.tracker().is_ok());
  assert(events.size() == 3);
  assert(events[2].state == HealthState::FAULT);
  assert(events[2].reason == FaultReason::TIMEOUT);

  // Heart resumes: back to OK after a resync and min_beats beats
  const uint64_t observed = receiver.beats_observed();
  executor.spawn(heart);
  executor.run_until(at(260ms), tick);
  assert(receiver.tracker().is_ok());
  assert(events.size() == 4);
  assert(events[3].reason == FaultReason::TIMEOUT);
  assert(receiver.beats_observed() > observed);
}

static void test_watchdog_task_ignores_edges_while_disarmed()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  mocks::LoopbackTransport link;
  auto tick = [&clock] {clock.tick();};

  Watchdog watchdog(make_config());
  WatchdogTask receiver(watchdog, link, make_runner_config());
  HeartTask heart(10ms, link);
  executor.spawn(heart);
  executor.spawn(receiver);

  executor.run_until(at(60ms), tick);
  assert(receiver.tracker().is_ok());

  watchdog.disarm();
  const uint64_t observed = receiver.beats_observed();
  executor.cancel(heart);
  executor.run_until(at(200ms), tick);

  // Silence while disarmed is not a fault
  assert(receiver.tracker().is_ok());
  assert(receiver.beats_observed() == observed);
  assert(link.pending() == 0);
}

static void test_watchdog_task_resyncs_after_external_arm()
{
  mocks::LoopbackTransport link;
  Watchdog watchdog(make_config());
  WatchdogTask receiver(watchdog, link, make_runner_config());
  std::vector<StateEvent> events;
  receiver.tracker().set_listener([&events](const StateEvent & e) {events.push_back(e);});
  bring_up(receiver, link);

  // The producer keeps alternating while nobody is watching
  watchdog.disarm();
  deliver(link, Edge::FALLING);
  receiver.poll(at(36ms));
  deliver(link, Edge::RISING);
  receiver.poll(at(46ms));
  deliver(link, Edge::FALLING);
  receiver.poll(at(56ms));

  // Operator re-arm; the next edge has the "wrong" polarity for the watchdog
  watchdog.arm(at(60ms));
  deliver(link, Edge::RISING);
  receiver.poll(at(66ms));
  assert(receiver.tracker().is_ok());
  assert(watchdog.last_accepted() == at(66ms));
  assert(watchdog.expected_edge() == Edge::FALLING);

  deliver(link, Edge::FALLING);
  receiver.poll(at(76ms));
  assert(receiver.tracker().is_ok());
  assert(watchdog.last_accepted() == at(76ms));
  assert(events.size() == 2);
}

static void test_watchdog_task_late_poll_coalesces_edges()
{
  mocks::LoopbackTransport link;
  Watchdog watchdog(make_config());
  WatchdogTask receiver(watchdog, link, make_runner_config());
  std::vector<StateEvent> events;
  receiver.tracker().set_listener([&events](const StateEvent & e) {events.push_back(e);});
  bring_up(receiver, link);
  const uint64_t observed = receiver.beats_observed();

  // Two on-time edges wait for one late poll
  deliver(link, Edge::FALLING);
  deliver(link, Edge::RISING);
  receiver.poll(at(36ms));
  assert(receiver.tracker().is_ok());
  assert(receiver.beats_observed() == observed + 1);
  assert(receiver.beats_coalesced() == 1);
  assert(watchdog.expected_edge() == Edge::FALLING);

  deliver(link, Edge::FALLING);
  receiver.poll(at(46ms));
  assert(receiver.tracker().is_ok());
  assert(events.size() == 2);

  // A repeated polarity within one poll is still judged
  deliver(link, Edge::RISING);
  deliver(link, Edge::RISING);
  receiver.poll(at(56ms));
  assert(!receiver.tracker().is_ok());
  assert(events.size() == 3);
  assert(events[2].reason == FaultReason::OUT_OF_ORDER);
  assert(receiver.beats_coalesced() == 1);
}

static void test_watchdog_task_records_transport_errors()
{
  CooperativeClock clock(1ms);
  CooperativeExecutor executor(clock);
  mocks::LoopbackTransport link;
  auto tick = [&clock] {clock.tick();};

  Watchdog watchdog(make_config());
  WatchdogTask receiver(watchdog, link, make_runner_config());
  executor.spawn(receiver);
  executor.run_until(at(6ms), tick);

  link.fail_recv(std::make_error_code(std::errc::io_error));
  executor.run_until(at(8ms), tick);

  assert(receiver.error_count() == 1);
  assert(receiver.last_error() == std::errc::io_error);
  // Still polling
  assert(executor.task_count() == 1);
  assert(watchdog.is_armed());
}

int main()
{
  printf("\n=== cooperative model unit tests ===\n\n");

  TEST(test_clock_ticks);
  TEST(test_executor_polls_due_tasks_in_spawn_order);
  TEST(test_executor_cancel_from_inside_poll);

  printf("\n  --- heart task ---\n");
  TEST(test_heart_task_cadence);
  TEST(test_heart_task_retries_failed_send);

  printf("\n  --- watchdog task ---\n");
  TEST(test_watchdog_task_detects_loss_and_recovery);
  TEST(test_watchdog_task_ignores_edges_while_disarmed);
  TEST(test_watchdog_task_resyncs_after_external_arm);
  TEST(test_watchdog_task_late_poll_coalesces_edges);
  TEST(test_watchdog_task_records_transport_errors);

  printf("\n=== %d / %d tests passed ===\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
