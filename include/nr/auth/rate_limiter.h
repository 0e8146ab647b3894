#pragma once
// TSK401_Gateway_Auth sliding-window attempt throttling

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nr::auth {

struct RateLimiterOptions {
  size_t max_attempts{5};
  std::chrono::seconds window{300};
  size_t max_keys{4096}; // table bound; idle keys are evicted first
};

struct RateLimiterHooks { // test seam for the window clock
  std::function<std::chrono::steady_clock::time_point()> now;
};

struct RateDecision {
  bool allowed{true};
  size_t attempts_in_window{0}; // before this attempt
  std::chrono::seconds retry_after{0};
  std::chrono::steady_clock::time_point attempt{}; // timestamp Admit recorded
};

// Attempts per client key inside a sliding window. Each key has its own lock;
// the table lock is only held to find or insert an entry.
class RateLimiter {
 public:
  explicit RateLimiter(RateLimiterOptions options = {}, RateLimiterHooks hooks = {});

  // Prunes, decides and records the attempt in one step under the key's lock,
  // so concurrent callers for one key never get more than max_attempts
  // admissions per window. Refused attempts are recorded too.
  RateDecision Admit(const std::string& key);
  // Withdraws an admitted attempt that turned out to succeed. Earlier
  // failures stay in the window.
  void Forgive(const std::string& key, std::chrono::steady_clock::time_point attempt);
  // Read-only view; never creates an entry.
  RateDecision Check(const std::string& key);

  size_t tracked_keys() const;
  const RateLimiterOptions& options() const noexcept { return options_; }

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::mutex mutex;
    std::deque<Clock::time_point> attempts;
    Clock::time_point last_attempt{};
  };

  Clock::time_point Now() const;
  std::shared_ptr<Entry> Find(const std::string& key) const;
  std::shared_ptr<Entry> FindOrCreate(const std::string& key, Clock::time_point now);
  void PruneLocked(Entry& entry, Clock::time_point now) const;
  RateDecision DecideLocked(Entry& entry, Clock::time_point now) const;
  void EvictLocked(Clock::time_point now);

  RateLimiterOptions options_;
  RateLimiterHooks hooks_;
  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> table_;
};

}  // namespace nr::auth
