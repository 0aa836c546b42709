#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sentinel {

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

const char* OutcomeLabel(Outcome outcome) {
  switch (outcome) {
    case Outcome::kPassed:
      return "passed";
    case Outcome::kRedacted:
      return "redacted";
    case Outcome::kBlocked:
      return "blocked";
    case Outcome::kOutputBlocked:
      return "output_blocked";
    case Outcome::kUpstreamFailed:
      return "upstream_failed";
    case Outcome::kRateLimited:
      return "rate_limited";
    case Outcome::kInvalidRequest:
      return "invalid_request";
  }
  return "unknown";
}

void GatewayMetrics::RecordOutcome(Outcome outcome) {
  outcomes_[static_cast<std::size_t>(outcome)].fetch_add(
      1, std::memory_order_relaxed);
}

uint64_t GatewayMetrics::OutcomeCount(Outcome outcome) const {
  return outcomes_[static_cast<std::size_t>(outcome)].load();
}

void GatewayMetrics::RecordUpstreamError(const std::string& provider,
                                         int status) {
  std::lock_guard<std::mutex> lock(provider_mutex_);
  ++upstream_errors_[provider + "|" + std::to_string(status)];
}

void GatewayMetrics::RecordUpstreamCall(const std::string& provider) {
  std::lock_guard<std::mutex> lock(provider_mutex_);
  ++upstream_calls_[provider];
}

void GatewayMetrics::RecordStreamSession(bool blocked) {
  stream_sessions_.fetch_add(1, std::memory_order_relaxed);
  if (blocked) {
    stream_blocks_.fetch_add(1, std::memory_order_relaxed);
  }
}

void GatewayMetrics::RecordProfileSwitch(bool ok) {
  if (ok) {
    profile_switches_.fetch_add(1, std::memory_order_relaxed);
  } else {
    profile_switch_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

void GatewayMetrics::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void GatewayMetrics::SetAuditDropped(uint64_t dropped) {
  audit_dropped_.store(dropped, std::memory_order_relaxed);
}

std::string GatewayMetrics::RenderPrometheus() const {
  std::ostringstream out;

  out << "# HELP sentinel_requests_total Requests by guardrail outcome\n";
  out << "# TYPE sentinel_requests_total counter\n";
  for (std::size_t i = 0; i < outcomes_.size(); ++i) {
    out << "sentinel_requests_total{outcome=\""
        << OutcomeLabel(static_cast<Outcome>(i)) << "\"} "
        << outcomes_[i].load() << "\n";
  }

  {
    std::lock_guard<std::mutex> lock(provider_mutex_);
    out << "# HELP sentinel_upstream_calls_total Upstream calls per provider\n";
    out << "# TYPE sentinel_upstream_calls_total counter\n";
    for (const auto& [provider, count] : upstream_calls_) {
      out << "sentinel_upstream_calls_total{provider=\"" << provider << "\"} "
          << count << "\n";
    }
    out << "# HELP sentinel_upstream_errors_total Failed upstream calls\n";
    out << "# TYPE sentinel_upstream_errors_total counter\n";
    for (const auto& [key, count] : upstream_errors_) {
      auto bar = key.find('|');
      out << "sentinel_upstream_errors_total{provider=\"" << key.substr(0, bar)
          << "\",status=\"" << key.substr(bar + 1) << "\"} " << count << "\n";
    }
  }

  out << "# HELP sentinel_stream_sessions_total Streaming sessions started\n";
  out << "# TYPE sentinel_stream_sessions_total counter\n";
  out << "sentinel_stream_sessions_total " << stream_sessions_.load() << "\n";
  out << "# HELP sentinel_stream_blocks_total Streaming sessions cut by a "
         "guardrail\n";
  out << "# TYPE sentinel_stream_blocks_total counter\n";
  out << "sentinel_stream_blocks_total " << stream_blocks_.load() << "\n";

  out << "# HELP sentinel_profile_switches_total Profile switches\n";
  out << "# TYPE sentinel_profile_switches_total counter\n";
  out << "sentinel_profile_switches_total{result=\"ok\"} "
      << profile_switches_.load() << "\n";
  out << "sentinel_profile_switches_total{result=\"error\"} "
      << profile_switch_failures_.load() << "\n";

  out << "# HELP sentinel_audit_dropped_total Audit records dropped by the "
         "bounded queue\n";
  out << "# TYPE sentinel_audit_dropped_total counter\n";
  out << "sentinel_audit_dropped_total " << audit_dropped_.load() << "\n";

  out << "# HELP sentinel_request_duration_ms Request end-to-end latency in "
         "milliseconds\n";
  out << "# TYPE sentinel_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "sentinel_request_duration_ms_bucket{le=\"" << std::fixed
        << std::setprecision(0) << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "sentinel_request_duration_ms_bucket{le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "sentinel_request_duration_ms_sum " << request_latency_.sum_ms.load()
      << "\n";
  out << "sentinel_request_duration_ms_count " << request_latency_.total.load()
      << "\n";

  return out.str();
}

}  // namespace sentinel
