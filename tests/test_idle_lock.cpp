#include "nr/orchestrator/idle_lock.h" // TSK404_Session_Idle_Timeout

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;
using nr::orchestrator::IdleLock;

// Wall-clock behaviour, short timeouts.
int RealClock() {
  IdleLock lock;
  std::atomic<int> fired{0};
  lock.on_expire = [&]() { fired.fetch_add(1, std::memory_order_relaxed); };
  lock.Arm(50ms);
  lock.Tick();
  std::this_thread::sleep_for(20ms);
  lock.Tick();
  if (fired.load(std::memory_order_relaxed) != 0) {
    return 1;
  }
  std::this_thread::sleep_for(80ms);
  lock.Tick();
  if (fired.load(std::memory_order_relaxed) != 1 || lock.armed()) {
    return 1;
  }
  lock.Arm(40ms);
  lock.NotifyActivity();
  std::this_thread::sleep_for(20ms);
  lock.Tick();
  if (fired.load(std::memory_order_relaxed) != 1) {
    return 1;
  }
  lock.NotifyActivity();
  std::this_thread::sleep_for(60ms);
  lock.Tick();
  if (fired.load(std::memory_order_relaxed) != 2) {
    return 1;
  }
  return 0;
}

int FakeClock() {
  IdleLock::Clock::time_point now{std::chrono::hours(1)};
  IdleLock lock([&now]() { return now; });
  int fired = 0;
  lock.on_expire = [&]() { ++fired; };

  // Disabled with a zero timeout.
  lock.Arm(0s);
  now += 1h;
  lock.Tick();
  if (fired != 0 || lock.armed()) {
    return 1;
  }

  lock.Arm(900s);
  for (int i = 0; i < 10; ++i) {
    now += 60s;
    lock.NotifyActivity();
    lock.Tick();
  }
  if (fired != 0) {
    return 1;
  }
  now += 899s;
  lock.Tick();
  if (fired != 0) {
    return 1;
  }
  now += 1s;
  lock.Tick();
  lock.Tick(); // fires once
  if (fired != 1) {
    return 1;
  }

  // Ticks stopped longer than the timeout (host suspended): expire even
  // though activity was recorded on resume before the first tick.
  lock.Arm(10s);
  now += 30s;
  lock.NotifyActivity();
  lock.Tick();
  if (fired != 2) {
    return 1;
  }

  // Disarm suppresses expiry.
  lock.Arm(10s);
  lock.Disarm();
  now += 60s;
  lock.Tick();
  if (fired != 2) {
    return 1;
  }

  // The callback may re-arm.
  lock.on_expire = [&]() {
    ++fired;
    lock.Arm(10s);
  };
  lock.Arm(10s);
  now += 10s;
  lock.Tick();
  if (fired != 3 || !lock.armed()) {
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  if (RealClock() != 0 || FakeClock() != 0) {
    std::cerr << "idle lock failed\n";
    return 1;
  }
  std::cout << "idle lock ok\n";
  return 0;
}
