#include "heartbeat_watchdog/watchdog_runner.hpp"

#include <optional>

namespace heartbeat_watchdog
{

WatchdogRunner::WatchdogRunner(
  Watchdog & watchdog, EdgeTransport & transport, const RunnerConfig & config)
: watchdog_(watchdog),
  transport_(transport),
  config_(config),
  tracker_(config.min_beats)
{
}

WatchdogRunner::~WatchdogRunner()
{
  stop();
}

bool WatchdogRunner::start()
{
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (thread_.joinable()) {
    thread_.join();  // previous run ended on its own
  }

  stop_requested_.store(false, std::memory_order_release);
  clock_.reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread([this] {run();});
  return true;
}

void WatchdogRunner::stop()
{
  stop_requested_.store(true, std::memory_order_release);
  clock_.interrupt();
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::error_code WatchdogRunner::run()
{
  running_.store(true, std::memory_order_release);
  tracker_.reset();

  std::error_code ec;
  if (!warmup(true, ec)) {
    return finish(ec);
  }

  while (!stop_requested_.load(std::memory_order_acquire)) {
    std::optional<Beat> beat;
    ec = transport_.recv_timeout(config_.poll_interval, beat);
    if (ec) {
      return finish(ec);
    }
    if (!watchdog_.is_armed()) {
      continue;
    }

    bool changed = false;
    if (beat) {
      if (!transport_.stamps_beats()) {
        beat->observed_at = clock_.now();
      }
      const uint32_t generation = watchdog_.arm_generation();
      if (generation != synced_generation_) {
        watchdog_.resync(*beat);
        synced_generation_ = generation;
        continue;
      }
      changed = tracker_.on_beat(watchdog_.observe(*beat));
    } else {
      changed = tracker_.on_check(watchdog_.check(clock_.now()));
    }

    if (changed && !tracker_.is_ok() && !warmup(false, ec)) {
      return finish(ec);
    }
  }
  return finish({});
}

bool WatchdogRunner::running() const
{
  return running_.load(std::memory_order_acquire);
}

std::error_code WatchdogRunner::last_error() const
{
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

HealthTracker & WatchdogRunner::tracker()
{
  return tracker_;
}

const HealthTracker & WatchdogRunner::tracker() const
{
  return tracker_;
}

bool WatchdogRunner::warmup(bool initial, std::error_code & ec)
{
  if (config_.warmup > Duration::zero() &&
    !clock_.sleep_until(clock_.now() + config_.warmup))
  {
    return false;  // stop requested
  }

  ec = transport_.clear();
  if (ec) {
    return false;
  }

  // After a fault, only re-arm if nobody disarmed us in the meantime
  if (initial || watchdog_.is_armed()) {
    watchdog_.arm(clock_.now());
  }
  return true;
}

std::error_code WatchdogRunner::finish(std::error_code ec)
{
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = ec;
  }
  running_.store(false, std::memory_order_release);
  return ec;
}

}  // namespace heartbeat_watchdog
