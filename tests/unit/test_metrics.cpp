#include <catch2/catch_test_macros.hpp>

#include "server/metrics/metrics.h"

#include <string>

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("Every outcome is rendered, even at zero", "[metrics]") {
  sentinel::GatewayMetrics metrics;
  auto output = metrics.RenderPrometheus();
  for (const char* label : {"passed", "redacted", "blocked", "output_blocked",
                            "upstream_failed", "rate_limited",
                            "invalid_request"}) {
    INFO(label);
    REQUIRE(Contains(output, std::string("sentinel_requests_total{outcome=\"") +
                                 label + "\"} 0"));
  }
  REQUIRE(Contains(output, "# TYPE sentinel_requests_total counter"));
}

TEST_CASE("Outcomes are counted", "[metrics]") {
  sentinel::GatewayMetrics metrics;
  metrics.RecordOutcome(sentinel::Outcome::kBlocked);
  metrics.RecordOutcome(sentinel::Outcome::kBlocked);
  metrics.RecordOutcome(sentinel::Outcome::kPassed);
  REQUIRE(metrics.OutcomeCount(sentinel::Outcome::kBlocked) == 2);
  auto output = metrics.RenderPrometheus();
  REQUIRE(Contains(output, "sentinel_requests_total{outcome=\"blocked\"} 2"));
  REQUIRE(Contains(output, "sentinel_requests_total{outcome=\"passed\"} 1"));
}

TEST_CASE("Upstream calls and errors are labelled by provider", "[metrics]") {
  sentinel::GatewayMetrics metrics;
  metrics.RecordUpstreamCall("openai");
  metrics.RecordUpstreamCall("openai");
  metrics.RecordUpstreamCall("anthropic");
  metrics.RecordUpstreamError("anthropic", 529);
  auto output = metrics.RenderPrometheus();
  REQUIRE(Contains(output, "sentinel_upstream_calls_total{provider=\"openai\"} 2"));
  REQUIRE(Contains(output,
                   "sentinel_upstream_calls_total{provider=\"anthropic\"} 1"));
  REQUIRE(Contains(
      output,
      "sentinel_upstream_errors_total{provider=\"anthropic\",status=\"529\"} 1"));
}

TEST_CASE("Stream sessions, profile switches and audit drops", "[metrics]") {
  sentinel::GatewayMetrics metrics;
  metrics.RecordStreamSession(false);
  metrics.RecordStreamSession(true);
  metrics.RecordProfileSwitch(true);
  metrics.RecordProfileSwitch(false);
  metrics.RecordProfileSwitch(false);
  metrics.SetAuditDropped(7);
  REQUIRE(metrics.ProfileSwitches() == 1);
  auto output = metrics.RenderPrometheus();
  REQUIRE(Contains(output, "sentinel_stream_sessions_total 2"));
  REQUIRE(Contains(output, "sentinel_stream_blocks_total 1"));
  REQUIRE(Contains(output, "sentinel_profile_switches_total{result=\"ok\"} 1"));
  REQUIRE(
      Contains(output, "sentinel_profile_switches_total{result=\"error\"} 2"));
  REQUIRE(Contains(output, "sentinel_audit_dropped_total 7"));
}

TEST_CASE("Latency histogram buckets are cumulative", "[metrics]") {
  sentinel::GatewayMetrics metrics;
  metrics.RecordLatency(80.0);
  metrics.RecordLatency(7000.0);
  auto output = metrics.RenderPrometheus();
  REQUIRE(Contains(output, "sentinel_request_duration_ms_bucket{le=\"50\"} 0"));
  REQUIRE(Contains(output, "sentinel_request_duration_ms_bucket{le=\"100\"} 1"));
  REQUIRE(
      Contains(output, "sentinel_request_duration_ms_bucket{le=\"5000\"} 1"));
  REQUIRE(
      Contains(output, "sentinel_request_duration_ms_bucket{le=\"+Inf\"} 2"));
  REQUIRE(Contains(output, "sentinel_request_duration_ms_sum 7080"));
  REQUIRE(Contains(output, "sentinel_request_duration_ms_count 2"));
}
