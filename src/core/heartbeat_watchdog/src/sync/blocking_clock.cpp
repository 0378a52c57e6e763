#include "heartbeat_watchdog/sync/blocking_clock.hpp"

namespace heartbeat_watchdog
{

Instant BlockingClock::now() const
{
  return std::chrono::steady_clock::now();
}

bool BlockingClock::sleep_until(Instant deadline)
{
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_until(lock, deadline, [this] {return interrupted_;});
}

void BlockingClock::interrupt()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

void BlockingClock::reset()
{
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = false;
}

bool BlockingClock::interrupted() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return interrupted_;
}

}  // namespace heartbeat_watchdog
