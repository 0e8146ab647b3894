#include "nr/auth/rate_limiter.h" // TSK401_Gateway_Auth

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using nr::auth::RateLimiter;
using nr::auth::RateLimiterHooks;
using nr::auth::RateLimiterOptions;

struct FakeClock {
  std::chrono::steady_clock::time_point now{std::chrono::hours(1)};

  RateLimiterHooks Hooks() {
    RateLimiterHooks hooks;
    hooks.now = [this]() { return now; };
    return hooks;
  }
};

void TestBlocksAfterMaxAttempts() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{5, 300s, 16}, clock.Hooks());
  const auto start = clock.now;
  for (int i = 0; i < 5; ++i) {
    auto decision = limiter.Admit("10.0.0.9");
    assert(decision.allowed);
    assert(decision.attempts_in_window == static_cast<size_t>(i));
    clock.now += 1s;
  }
  assert(clock.now - start == 5s);
  auto blocked = limiter.Admit("10.0.0.9");
  assert(!blocked.allowed);
  assert(blocked.attempts_in_window == 5);
  // The oldest attempt leaves the window at start + 300s.
  assert(blocked.retry_after == 295s);
  // Refused attempts count as well.
  assert(limiter.Check("10.0.0.9").attempts_in_window == 6);

  // Other clients are unaffected.
  assert(limiter.Check("10.0.0.10").allowed);
}

void TestWindowSlides() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{3, 60s, 16}, clock.Hooks());
  for (int i = 0; i < 3; ++i) {
    (void)limiter.Admit("client");
    clock.now += 10s;
  }
  assert(!limiter.Check("client").allowed);

  clock.now += 29s; // 59s after the first attempt
  assert(!limiter.Check("client").allowed);
  assert(limiter.Check("client").retry_after == 1s);

  clock.now += 1s; // the first attempt ages out
  auto reopened = limiter.Check("client");
  assert(reopened.allowed);
  assert(reopened.attempts_in_window == 2);
}

void TestRetryHintRoundsUp() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{1, 10s, 16}, clock.Hooks());
  (void)limiter.Admit("k");
  clock.now += 2500ms;
  auto decision = limiter.Check("k");
  assert(!decision.allowed);
  assert(decision.retry_after == 8s);
}

void TestCheckDoesNotCreateEntries() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{2, 60s, 16}, clock.Hooks());
  assert(limiter.Check("unseen").allowed);
  assert(limiter.tracked_keys() == 0);
  limiter.Forgive("unseen", clock.now);
  assert(limiter.tracked_keys() == 0);
}

void TestForgiveReturnsOnlyItsOwnSlot() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{2, 60s, 16}, clock.Hooks());
  (void)limiter.Admit("op"); // failed attempt
  clock.now += 1s;
  auto success = limiter.Admit("op");
  assert(success.allowed);
  limiter.Forgive("op", success.attempt);
  assert(limiter.Check("op").attempts_in_window == 1);
  clock.now += 1s;
  (void)limiter.Admit("op"); // second failure fills the window
  assert(!limiter.Check("op").allowed);
}

// Admissions for one key are serialized, so a burst cannot outrun the budget
// even when every caller is slow to finish.
void TestParallelAdmissionsShareOneBudget() {
  RateLimiterHooks hooks;
  hooks.now = []() {
    std::this_thread::sleep_for(2ms);
    return std::chrono::steady_clock::now();
  };
  RateLimiter limiter(RateLimiterOptions{5, 300s, 16}, hooks);
  (void)limiter.Admit("10.0.0.9");

  std::atomic<int> admitted{0};
  std::atomic<int> refused{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 20; ++i) {
    workers.emplace_back([&]() {
      if (limiter.Admit("10.0.0.9").allowed) {
        admitted.fetch_add(1);
      } else {
        refused.fetch_add(1);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  assert(admitted.load() == 4);
  assert(refused.load() == 16);
}

void TestTableIsBounded() {
  FakeClock clock;
  RateLimiter limiter(RateLimiterOptions{2, 60s, 2}, clock.Hooks());
  (void)limiter.Admit("a");
  clock.now += 1s;
  (void)limiter.Admit("b");
  clock.now += 1s;
  (void)limiter.Admit("c"); // evicts the least recently seen key
  assert(limiter.tracked_keys() == 2);
  assert(limiter.Check("a").attempts_in_window == 0);
  assert(limiter.Check("b").attempts_in_window == 1);
  assert(limiter.Check("c").attempts_in_window == 1);

  clock.now += 120s; // everything idle
  (void)limiter.Admit("d");
  (void)limiter.Admit("d");
  assert(limiter.tracked_keys() == 1);
  assert(!limiter.Check("d").allowed);
}

}  // namespace

int main() {
  TestBlocksAfterMaxAttempts();
  TestWindowSlides();
  TestRetryHintRoundsUp();
  TestCheckDoesNotCreateEntries();
  TestForgiveReturnsOnlyItsOwnSlot();
  TestParallelAdmissionsShareOneBudget();
  TestTableIsBounded();
  std::cout << "rate limiter ok\n";
  return 0;
}
