#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace sentinel {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{};  // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Outcome classes counted per request.
enum class Outcome {
  kPassed,
  kRedacted,
  kBlocked,
  kOutputBlocked,
  kUpstreamFailed,
  kRateLimited,
  kInvalidRequest,
};

const char* OutcomeLabel(Outcome outcome);

class GatewayMetrics {
 public:
  void RecordOutcome(Outcome outcome);
  void RecordUpstreamError(const std::string& provider, int status);
  void RecordUpstreamCall(const std::string& provider);
  void RecordStreamSession(bool blocked);
  void RecordProfileSwitch(bool ok);
  void RecordLatency(double request_ms);
  void SetAuditDropped(uint64_t dropped);

  uint64_t OutcomeCount(Outcome outcome) const;
  uint64_t ProfileSwitches() const { return profile_switches_.load(); }

  std::string RenderPrometheus() const;

 private:
  std::array<std::atomic<uint64_t>, 7> outcomes_{};
  std::atomic<uint64_t> stream_sessions_{0};
  std::atomic<uint64_t> stream_blocks_{0};
  std::atomic<uint64_t> profile_switches_{0};
  std::atomic<uint64_t> profile_switch_failures_{0};
  std::atomic<uint64_t> audit_dropped_{0};
  LatencyHistogram request_latency_;

  mutable std::mutex provider_mutex_;
  std::map<std::string, uint64_t> upstream_calls_;
  // Keyed by "provider|status".
  std::map<std::string, uint64_t> upstream_errors_;
};

}  // namespace sentinel
