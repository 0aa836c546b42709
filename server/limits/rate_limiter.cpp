#include "server/limits/rate_limiter.h"

#include <algorithm>

namespace sentinel {

namespace {
constexpr std::size_t kEvictionThreshold = 4096;
}  // namespace

RateLimiter::RateLimiter(int requests_per_minute)
    : requests_per_minute_(requests_per_minute),
      refill_per_second_(requests_per_minute > 0 ? requests_per_minute / 60.0
                                                 : 0.0),
      last_eviction_(std::chrono::steady_clock::now()) {}

bool RateLimiter::Allow(const std::string& client_id) {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_per_minute_ <= 0) {
    return true;
  }
  if (entries_.size() >= kEvictionThreshold) {
    EvictIdle(now);
  }
  auto it = entries_.find(client_id);
  if (it == entries_.end()) {
    it = entries_.emplace(client_id, Entry{requests_per_minute_, now}).first;
  }
  auto& entry = it->second;
  auto elapsed =
      std::chrono::duration_cast<std::chrono::duration<double>>(now - entry.last)
          .count();
  entry.tokens = std::min<double>(requests_per_minute_,
                                  entry.tokens + elapsed * refill_per_second_);
  entry.last = now;
  if (entry.tokens >= 1.0) {
    entry.tokens -= 1.0;
    return true;
  }
  return false;
}

void RateLimiter::EvictIdle(std::chrono::steady_clock::time_point now) {
  if (now - last_eviction_ < std::chrono::seconds(1)) {
    return;
  }
  last_eviction_ = now;
  // A bucket idle for a full minute has refilled completely.
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.last >= std::chrono::minutes(1)) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

void RateLimiter::UpdateLimit(int requests_per_minute) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_per_minute_ = requests_per_minute;
  refill_per_second_ =
      requests_per_minute > 0 ? requests_per_minute / 60.0 : 0.0;
  entries_.clear();
}

bool RateLimiter::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_per_minute_ > 0;
}

int RateLimiter::CurrentLimit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(requests_per_minute_);
}

std::size_t RateLimiter::TrackedClients() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

AdmissionHook MakeRateLimitHook(std::shared_ptr<RateLimiter> limiter) {
  return [limiter](const std::string& client_id) {
    return limiter->Allow(client_id);
  };
}

}  // namespace sentinel
