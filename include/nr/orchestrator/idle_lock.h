#pragma once
// TSK404_Session_Idle_Timeout idle expiry for gateway sessions

#include <chrono>
#include <functional>
#include <mutex>

namespace nr::orchestrator {

// Fires on_expire once when Tick() sees no activity for the armed timeout, or
// when ticks stopped for longer than the timeout (host suspend). Re-arm to
// reuse.
class IdleLock {
 public:
  using Clock = std::chrono::steady_clock;
  using Duration = Clock::duration;
  using NowFn = std::function<Clock::time_point()>;

  IdleLock() = default;
  explicit IdleLock(NowFn now) : now_(std::move(now)) {}

  void Arm(Duration timeout);
  void Disarm() noexcept;
  void NotifyActivity() noexcept;
  void Tick();
  bool armed() const noexcept;

  std::function<void()> on_expire;

 private:
  Clock::time_point Now() const { return now_ ? now_() : Clock::now(); }

  NowFn now_;
  mutable std::mutex mutex_;
  Duration timeout_{Duration::zero()};
  Clock::time_point last_activity_{};
  Clock::time_point last_tick_{};
  bool armed_{false};
};

}  // namespace nr::orchestrator
