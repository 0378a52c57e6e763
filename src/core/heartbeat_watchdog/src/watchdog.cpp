#include "heartbeat_watchdog/watchdog.hpp"

#include <stdexcept>
#include <string>

namespace heartbeat_watchdog
{

namespace
{

const WatchdogConfig & validated(const WatchdogConfig & config)
{
  std::string reason;
  if (!config.validate(&reason)) {
    throw std::invalid_argument("invalid watchdog configuration: " + reason);
  }
  return config;
}

}  // namespace

Watchdog::Watchdog(const WatchdogConfig & config)
: config_(validated(config)),
  window_(config_.window())
{
}

void Watchdog::arm(Instant now)
{
  last_accepted_.store(now);
  arm_generation_.fetch_add(1, std::memory_order_release);
  armed_.store(true, std::memory_order_release);
}

void Watchdog::disarm()
{
  armed_.store(false, std::memory_order_release);
}

bool Watchdog::is_armed() const
{
  return armed_.load(std::memory_order_acquire);
}

uint32_t Watchdog::arm_generation() const
{
  return arm_generation_.load(std::memory_order_acquire);
}

Verdict Watchdog::observe(const Beat & beat)
{
  if (!is_armed()) {
    return Verdict::healthy();
  }

  const Duration elapsed = silence_since(beat.observed_at);

  if (elapsed >= config_.max_silence) {
    return Verdict::timeout(elapsed);
  }

  const Edge expected = expected_edge_.load();
  if (config_.ordered && beat.edge != expected) {
    return Verdict::out_of_order(expected, beat.edge);
  }

  // Early or late but present and in order: still a liveness signal
  accept(beat);
  if (!window_.contains(elapsed)) {
    return Verdict::window(window_, elapsed);
  }
  return Verdict::healthy();
}

Verdict Watchdog::check(Instant now) const
{
  if (!is_armed()) {
    return Verdict::healthy();
  }

  const Duration elapsed = silence_since(now);
  if (elapsed >= config_.max_silence) {
    return Verdict::timeout(elapsed);
  }
  return Verdict::healthy();
}

void Watchdog::resync(const Beat & beat)
{
  if (!is_armed()) {
    return;
  }
  last_accepted_.store(beat.observed_at);
  expected_edge_.store(opposite(beat.edge));
}

const WatchdogConfig & Watchdog::config() const
{
  return config_;
}

Instant Watchdog::last_accepted() const
{
  return last_accepted_.load();
}

Edge Watchdog::expected_edge() const
{
  return expected_edge_.load();
}

Duration Watchdog::silence_since(Instant now) const
{
  // A beat stamped before a concurrent re-arm counts as zero elapsed time
  const Duration elapsed = now - last_accepted_.load();
  return elapsed < Duration::zero() ? Duration::zero() : elapsed;
}

void Watchdog::accept(const Beat & beat)
{
  last_accepted_.store(beat.observed_at);
  expected_edge_.store(opposite(expected_edge_.load()));
}

}  // namespace heartbeat_watchdog
