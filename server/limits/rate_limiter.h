#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sentinel {

// Pre-check run before any guardrail or upstream work. Returns false to
// reject the request with 429.
using AdmissionHook = std::function<bool(const std::string& client_id)>;

// Token bucket per client id. A limit of 0 admits everything.
class RateLimiter {
 public:
  explicit RateLimiter(int requests_per_minute);

  bool Allow(const std::string& client_id);
  bool Enabled() const;
  void UpdateLimit(int requests_per_minute);
  int CurrentLimit() const;
  std::size_t TrackedClients() const;

 private:
  struct Entry {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last;
  };

  // Drops buckets that have been idle long enough to be full again.
  void EvictIdle(std::chrono::steady_clock::time_point now);

  double requests_per_minute_;
  double refill_per_second_;
  std::unordered_map<std::string, Entry> entries_;
  std::chrono::steady_clock::time_point last_eviction_;
  mutable std::mutex mutex_;
};

// Admission hook backed by `limiter`; the hook shares ownership.
AdmissionHook MakeRateLimitHook(std::shared_ptr<RateLimiter> limiter);

}  // namespace sentinel
