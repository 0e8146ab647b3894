#include "nr/orchestrator/idle_lock.h"

namespace nr::orchestrator {

namespace {
constexpr IdleLock::Duration kSleepTolerance = std::chrono::seconds(2); // resume guard
}  // namespace

void IdleLock::Arm(Duration timeout) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (timeout <= Duration::zero()) {
    armed_ = false;
    timeout_ = Duration::zero();
    return;
  }
  timeout_ = timeout;
  last_activity_ = Now();
  last_tick_ = last_activity_;
  armed_ = true;
}

void IdleLock::Disarm() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  armed_ = false;
  timeout_ = Duration::zero();
}

void IdleLock::NotifyActivity() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!armed_) {
    return;
  }
  last_activity_ = Now();
}

bool IdleLock::armed() const noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  return armed_;
}

void IdleLock::Tick() {
  std::function<void()> expire;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto now = Now();
    if (!armed_) {
      last_tick_ = now;
      return;
    }
    const auto since_activity = now - last_activity_;
    const auto since_tick = now - last_tick_;
    last_tick_ = now;
    if (since_activity >= timeout_ || since_tick > timeout_ + kSleepTolerance) {
      armed_ = false;
      expire = on_expire;
    }
  }
  // Called without the lock so the callback may Arm() again.
  if (expire) {
    expire();
  }
}

}  // namespace nr::orchestrator
