#include "nr/auth/rate_limiter.h"

#include <algorithm>
#include <iterator>

namespace nr::auth {

RateLimiter::RateLimiter(RateLimiterOptions options, RateLimiterHooks hooks)
    : options_(options), hooks_(std::move(hooks)) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
  if (options_.max_keys == 0) {
    options_.max_keys = 1;
  }
}

RateLimiter::Clock::time_point RateLimiter::Now() const {
  return hooks_.now ? hooks_.now() : Clock::now();
}

std::shared_ptr<RateLimiter::Entry> RateLimiter::Find(const std::string& key) const {
  std::lock_guard<std::mutex> guard(table_mutex_);
  auto it = table_.find(key);
  return it == table_.end() ? nullptr : it->second;
}

std::shared_ptr<RateLimiter::Entry> RateLimiter::FindOrCreate(const std::string& key,
                                                              Clock::time_point now) {
  std::lock_guard<std::mutex> guard(table_mutex_);
  auto it = table_.find(key);
  if (it != table_.end()) {
    return it->second;
  }
  if (table_.size() >= options_.max_keys) {
    EvictLocked(now);
  }
  auto entry = std::make_shared<Entry>();
  table_.emplace(key, entry);
  return entry;
}

void RateLimiter::PruneLocked(Entry& entry, Clock::time_point now) const {
  const auto horizon = now - options_.window;
  while (!entry.attempts.empty() && entry.attempts.front() <= horizon) {
    entry.attempts.pop_front();
  }
}

// Drops keys with nothing left in the window, then the least recently seen
// key if the table is still full.
void RateLimiter::EvictLocked(Clock::time_point now) {
  const auto horizon = now - options_.window;
  for (auto it = table_.begin(); it != table_.end();) {
    std::unique_lock<std::mutex> entry_lock(it->second->mutex, std::try_to_lock);
    if (entry_lock.owns_lock() && it->second->last_attempt <= horizon) {
      entry_lock.unlock();
      it = table_.erase(it);
    } else {
      ++it;
    }
  }
  if (table_.size() < options_.max_keys || table_.empty()) {
    return;
  }
  auto oldest = table_.begin();
  for (auto it = table_.begin(); it != table_.end(); ++it) {
    if (it->second->last_attempt < oldest->second->last_attempt) {
      oldest = it;
    }
  }
  table_.erase(oldest);
}

RateDecision RateLimiter::DecideLocked(Entry& entry, Clock::time_point now) const {
  RateDecision decision;
  decision.attempt = now;
  PruneLocked(entry, now);
  decision.attempts_in_window = entry.attempts.size();
  if (entry.attempts.size() < options_.max_attempts) {
    return decision;
  }
  decision.allowed = false;
  // The window reopens when the oldest attempt that keeps it full ages out.
  const auto pivot = entry.attempts[entry.attempts.size() - options_.max_attempts];
  const auto remaining = pivot + options_.window - now;
  auto seconds = std::chrono::ceil<std::chrono::seconds>(remaining);
  decision.retry_after = std::max(seconds, std::chrono::seconds(1));
  return decision;
}

RateDecision RateLimiter::Check(const std::string& key) {
  auto entry = Find(key);
  if (!entry) {
    return RateDecision{};
  }
  std::lock_guard<std::mutex> guard(entry->mutex);
  return DecideLocked(*entry, Now());
}

RateDecision RateLimiter::Admit(const std::string& key) {
  auto entry = FindOrCreate(key, Now());
  std::lock_guard<std::mutex> guard(entry->mutex);
  // Read under the entry lock so attempts stay in time order.
  const auto now = Now();
  const auto decision = DecideLocked(*entry, now);
  entry->attempts.push_back(now);
  entry->last_attempt = now;
  const size_t cap = options_.max_attempts * 4;
  while (entry->attempts.size() > cap) {
    entry->attempts.pop_front();
  }
  return decision;
}

void RateLimiter::Forgive(const std::string& key, Clock::time_point attempt) {
  auto entry = Find(key);
  if (!entry) {
    return;
  }
  std::lock_guard<std::mutex> guard(entry->mutex);
  auto it = std::find(entry->attempts.rbegin(), entry->attempts.rend(), attempt);
  if (it != entry->attempts.rend()) {
    entry->attempts.erase(std::next(it).base());
  }
}

size_t RateLimiter::tracked_keys() const {
  std::lock_guard<std::mutex> guard(table_mutex_);
  return table_.size();
}

}  // namespace nr::auth
