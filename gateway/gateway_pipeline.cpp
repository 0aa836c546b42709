#include "gateway/gateway_pipeline.h"

#include "gateway/adapters/provider_adapter.h"
#include "server/logging/logger.h"

#include <chrono>
#include <ctime>
#include <set>
#include <stdexcept>
#include <vector>

namespace sentinel {

namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

json ErrorJson(const std::string& message, const std::string& type,
               const std::string& code) {
  CanonicalError error;
  error.message = message;
  error.type = type;
  error.code = code;
  return ErrorBody(error);
}

bool IsSuccess(int status) { return status >= 200 && status < 300; }

std::string UpstreamVerdict(int status) {
  return "FAILED_UPSTREAM_" + std::to_string(status);
}

// Adapts an upstream SSE stream to text deltas.
class UpstreamDeltaSource : public DeltaSource {
 public:
  UpstreamDeltaSource(std::unique_ptr<UpstreamStream> stream,
                      const ProviderAdapter& adapter)
      : stream_(std::move(stream)), adapter_(adapter) {}

  bool Next(std::string* delta) override {
    std::string data;
    while (!done_ && stream_->NextEvent(&data)) {
      StreamDelta event;
      if (!adapter_.ParseStreamEvent(data, &event)) {
        continue;
      }
      if (!event.finish_reason.empty()) {
        finish_reason_ = event.finish_reason;
      }
      if (event.done) {
        done_ = true;
      }
      if (!event.content.empty()) {
        *delta = std::move(event.content);
        return true;
      }
    }
    done_ = true;
    return false;
  }

  void Close() override {
    done_ = true;
    stream_->Close();
  }

  const std::string& finish_reason() const { return finish_reason_; }

 private:
  std::unique_ptr<UpstreamStream> stream_;
  const ProviderAdapter& adapter_;
  std::string finish_reason_;
  bool done_{false};
};

// Replays a fixed completion word by word.
class ScriptedDeltaSource : public DeltaSource {
 public:
  explicit ScriptedDeltaSource(const std::string& text) {
    std::string current;
    for (char c : text) {
      current.push_back(c);
      if (c == ' ') {
        deltas_.push_back(current);
        current.clear();
      }
    }
    if (!current.empty()) {
      deltas_.push_back(current);
    }
  }

  bool Next(std::string* delta) override {
    if (next_ >= deltas_.size()) {
      return false;
    }
    *delta = deltas_[next_++];
    return true;
  }

  void Close() override { next_ = deltas_.size(); }

 private:
  std::vector<std::string> deltas_;
  std::size_t next_{0};
};

}  // namespace

json PolicyViolationBody(const std::string& prefix,
                         const std::string& reason) {
  return ErrorJson(prefix + ": " + reason, "invalid_request_error",
                   "security_policy_violation");
}

json RateLimitedBody() {
  return ErrorJson("Rate limit exceeded", "rate_limit_error", "rate_limited");
}

json InvalidRequestBody(const std::string& message) {
  return ErrorJson(message, "invalid_request_error", "invalid_request");
}

GatewayPipeline::GatewayPipeline(std::shared_ptr<EngineHandle> engines,
                                 std::shared_ptr<const ProviderRouter> router,
                                 std::shared_ptr<UpstreamTransport> transport,
                                 std::shared_ptr<AuditSink> audit,
                                 std::shared_ptr<GatewayMetrics> metrics,
                                 GatewayOptions options)
    : engines_(std::move(engines)),
      router_(std::move(router)),
      transport_(std::move(transport)),
      audit_(std::move(audit)),
      metrics_(std::move(metrics)),
      options_(std::move(options)) {
  if (!engines_ || !router_) {
    throw std::invalid_argument("GatewayPipeline needs an engine handle and a router");
  }
  if (!transport_ && !options_.mock_upstream) {
    throw std::invalid_argument(
        "GatewayPipeline needs an upstream transport unless mocking");
  }
}

bool GatewayPipeline::Admit(const std::string& client_id) {
  return !admission_ || admission_(client_id);
}

GatewayPipeline::InputCheck GatewayPipeline::CheckInput(
    const GuardrailEngine& engine, const CanonicalRequest& request) const {
  InputCheck check;
  check.request = request;
  std::vector<std::string> reasons;
  std::set<std::string> seen;
  for (auto& message : check.request.messages) {
    if (!check.original_text.empty()) {
      check.original_text += "\n";
      check.sanitized_text += "\n";
    }
    check.original_text += message.content;
    GuardrailVerdict verdict = engine.Validate(message.content);
    check.sanitized_text += verdict.sanitized_text;
    if (verdict.action == GuardrailAction::kBlocked) {
      check.blocked = true;
      if (seen.insert(verdict.reason).second) {
        reasons.push_back(verdict.reason);
      }
    } else if (verdict.action == GuardrailAction::kRedacted) {
      check.redacted = true;
    }
    message.content = std::move(verdict.sanitized_text);
  }
  for (std::size_t i = 0; i < reasons.size(); ++i) {
    if (i) {
      check.reason += ", ";
    }
    check.reason += reasons[i];
  }
  return check;
}

CanonicalResponse GatewayPipeline::MockResponse(
    const CanonicalRequest& request) const {
  CanonicalResponse response;
  response.id = NewCompletionId();
  response.model = request.model;
  CanonicalChoice choice;
  choice.message.role = "assistant";
  choice.message.content = "Mock Response (" + request.model +
                           "). Sanitized Input: '" +
                           LastUserContent(request) + "'";
  choice.finish_reason = "stop";
  response.choices.push_back(std::move(choice));
  return response;
}

void GatewayPipeline::Audit(const std::string& client_id,
                            const InputCheck& input,
                            const std::string& verdict, double latency_ms,
                            json metadata) const {
  if (metrics_) {
    metrics_->RecordLatency(latency_ms);
  }
  if (!audit_) {
    return;
  }
  AuditRecord record;
  record.client_id = client_id;
  record.original_text = input.original_text;
  record.sanitized_text = input.sanitized_text;
  record.verdict = verdict;
  record.latency_ms = latency_ms;
  record.metadata = std::move(metadata);
  audit_->Record(record);
}

GatewayResult GatewayPipeline::Handle(const std::string& client_id,
                                      const CanonicalRequest& request) {
  auto start = Clock::now();
  GatewayResult result;
  json metadata = {{"model", request.model}, {"stream", false}};

  if (!Admit(client_id)) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kRateLimited);
    log::Warn("pipeline", "request rejected by admission hook",
              "client=" + client_id);
    result.status = 429;
    result.body = RateLimitedBody();
    result.verdict = "RATE_LIMITED";
    Audit(client_id, InputCheck{}, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  auto engine = engines_->Current();
  metadata["profile"] = engine->ProfileName();
  InputCheck input = CheckInput(*engine, request);
  input.request.stream = false;
  if (input.blocked) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kBlocked);
    log::Info("pipeline", "request blocked",
              "client=" + client_id + " reason=" + input.reason);
    result.status = 400;
    result.body =
        PolicyViolationBody("Request blocked by security guardrails",
                            input.reason);
    result.verdict = "BLOCKED: " + input.reason;
    Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  CanonicalResponse response;
  if (options_.mock_upstream) {
    metadata["provider"] = "mock";
    response = MockResponse(input.request);
  } else {
    RouteTarget route = router_->Resolve(request.model);
    const ProviderAdapter& adapter = AdapterFor(route.wire_format);
    metadata["provider"] = route.provider;
    if (metrics_) metrics_->RecordUpstreamCall(route.provider);

    auto fail = [&](int status, json body) {
      if (metrics_) {
        metrics_->RecordOutcome(Outcome::kUpstreamFailed);
        metrics_->RecordUpstreamError(route.provider, status);
      }
      result.status = status;
      result.body = std::move(body);
      result.verdict = UpstreamVerdict(status);
      metadata["upstream_status"] = status;
      Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
      return result;
    };

    HttpResponse upstream;
    try {
      upstream = transport_->Post(route.endpoint_url,
                                  adapter.ToUpstream(input.request).dump(),
                                  route.headers);
    } catch (const HttpTimeoutError& ex) {
      log::Error("upstream", "upstream call timed out",
                 "provider=" + route.provider + " error=" + ex.what());
      return fail(504, ErrorJson(std::string("Gateway Timeout: ") + ex.what(),
                                 "upstream_error", "upstream_timeout"));
    } catch (const std::exception& ex) {
      log::Error("upstream", "upstream call failed",
                 "provider=" + route.provider + " error=" + ex.what());
      return fail(502, ErrorJson(std::string("Gateway Connection Failed: ") +
                                     ex.what(),
                                 "upstream_error", "upstream_unreachable"));
    }

    if (!IsSuccess(upstream.status)) {
      CanonicalError error =
          adapter.FromUpstreamError(upstream.body, upstream.status);
      log::Warn("upstream", "upstream returned an error",
                "provider=" + route.provider +
                    " status=" + std::to_string(upstream.status) +
                    " message=" + error.message);
      return fail(upstream.status, ErrorBody(error));
    }

    std::string parse_error;
    auto body = json::parse(upstream.body, nullptr, false);
    bool parsed = false;
    if (!body.is_discarded()) {
      try {
        parsed = adapter.FromUpstream(body, &response, &parse_error);
      } catch (const json::exception& ex) {
        parse_error = ex.what();
      }
    } else {
      parse_error = "body is not JSON";
    }
    if (!parsed) {
      log::Error("upstream", "malformed upstream response",
                 "provider=" + route.provider + " error=" + parse_error);
      return fail(502, ErrorJson("Malformed upstream response: " + parse_error,
                                 "upstream_error",
                                 "upstream_malformed_response"));
    }
  }
  if (response.model.empty()) {
    response.model = request.model;
  }

  bool output_redacted = false;
  for (auto& choice : response.choices) {
    GuardrailVerdict verdict = engine->ValidateOutput(choice.message.content);
    if (verdict.action == GuardrailAction::kBlocked) {
      if (metrics_) metrics_->RecordOutcome(Outcome::kOutputBlocked);
      log::Info("pipeline", "response blocked",
                "client=" + client_id + " reason=" + verdict.reason);
      result.status = 400;
      result.body = PolicyViolationBody(
          "Response blocked by security guardrails", verdict.reason);
      result.verdict = "OUTPUT_BLOCKED: " + verdict.reason;
      Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
      return result;
    }
    if (verdict.action == GuardrailAction::kRedacted) {
      output_redacted = true;
      choice.message.content = std::move(verdict.sanitized_text);
    }
  }

  bool redacted = input.redacted || output_redacted;
  if (metrics_) {
    metrics_->RecordOutcome(redacted ? Outcome::kRedacted : Outcome::kPassed);
  }
  result.status = 200;
  result.body = ToJson(response);
  result.verdict = redacted ? "REDACTED" : "PASSED";
  Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
  return result;
}

StreamResult GatewayPipeline::HandleStream(const std::string& client_id,
                                           const CanonicalRequest& request,
                                           const StreamWriter& write) {
  auto start = Clock::now();
  StreamResult result;
  json metadata = {{"model", request.model}, {"stream", true}};

  if (!Admit(client_id)) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kRateLimited);
    result.status = 429;
    result.error_body = RateLimitedBody();
    result.verdict = "RATE_LIMITED";
    Audit(client_id, InputCheck{}, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  auto engine = engines_->Current();
  metadata["profile"] = engine->ProfileName();
  InputCheck input = CheckInput(*engine, request);
  input.request.stream = true;
  if (input.blocked) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kBlocked);
    log::Info("pipeline", "stream request blocked",
              "client=" + client_id + " reason=" + input.reason);
    result.status = 400;
    result.error_body = PolicyViolationBody(
        "Request blocked by security guardrails", input.reason);
    result.verdict = "BLOCKED: " + input.reason;
    Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  std::unique_ptr<DeltaSource> source;
  UpstreamDeltaSource* upstream_source = nullptr;
  std::string provider = "mock";
  if (options_.mock_upstream) {
    source = std::make_unique<ScriptedDeltaSource>(
        MockResponse(input.request).choices.front().message.content);
  } else {
    RouteTarget route = router_->Resolve(request.model);
    provider = route.provider;
    const ProviderAdapter& adapter = AdapterFor(route.wire_format);
    if (metrics_) metrics_->RecordUpstreamCall(provider);

    auto fail = [&](int status, json body) {
      if (metrics_) {
        metrics_->RecordOutcome(Outcome::kUpstreamFailed);
        metrics_->RecordUpstreamError(provider, status);
      }
      result.status = status;
      result.error_body = std::move(body);
      result.verdict = UpstreamVerdict(status);
      metadata["provider"] = provider;
      metadata["upstream_status"] = status;
      Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
      return result;
    };

    std::unique_ptr<UpstreamStream> stream;
    try {
      stream = transport_->OpenStream(route.stream_endpoint_url,
                                      adapter.ToUpstream(input.request).dump(),
                                      route.headers);
      if (!IsSuccess(stream->Status())) {
        int status = stream->Status();
        CanonicalError error = adapter.FromUpstreamError(stream->ReadBody(),
                                                         status);
        stream->Close();
        log::Warn("upstream", "upstream stream returned an error",
                  "provider=" + provider + " status=" + std::to_string(status));
        return fail(status, ErrorBody(error));
      }
    } catch (const HttpTimeoutError& ex) {
      log::Error("upstream", "upstream stream timed out",
                 "provider=" + provider + " error=" + ex.what());
      return fail(504, ErrorJson(std::string("Gateway Timeout: ") + ex.what(),
                                 "upstream_error", "upstream_timeout"));
    } catch (const std::exception& ex) {
      log::Error("upstream", "upstream stream failed",
                 "provider=" + provider + " error=" + ex.what());
      return fail(502, ErrorJson(std::string("Gateway Connection Failed: ") +
                                     ex.what(),
                                 "upstream_error", "upstream_unreachable"));
    }
    auto adapted =
        std::make_unique<UpstreamDeltaSource>(std::move(stream), adapter);
    upstream_source = adapted.get();
    source = std::move(adapted);
  }
  metadata["provider"] = provider;

  SanitizedStream sanitized(std::move(source), engine, options_.stream);
  const std::string id = NewCompletionId();
  const std::time_t created = std::time(nullptr);
  result.started = true;

  auto send = [&](const std::string& frame) {
    if (result.cancelled) {
      return false;
    }
    if (!write(frame)) {
      result.cancelled = true;
      sanitized.Close();
      return false;
    }
    return true;
  };

  std::string fragment;
  try {
    while (sanitized.Next(&fragment)) {
      if (!send(BuildStreamChunk(id, request.model, created, fragment))) {
        break;
      }
    }
  } catch (const std::exception& ex) {
    // Upstream died mid-stream; whatever is still pending is discarded.
    log::Error("upstream", "upstream stream broke",
               "provider=" + provider + " error=" + ex.what());
    sanitized.Close();
    if (metrics_) {
      metrics_->RecordOutcome(Outcome::kUpstreamFailed);
      metrics_->RecordUpstreamError(provider, 502);
    }
    json error = ErrorJson(std::string("Upstream stream failed: ") + ex.what(),
                           "upstream_error", "upstream_stream_error");
    send("data: " +
         error.dump(-1, ' ', false, json::error_handler_t::replace) +
         "\n\n");
    send(kStreamDoneFrame);
    result.status = 502;
    result.verdict = UpstreamVerdict(502);
    Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  const bool blocked = sanitized.sanitizer().Blocked();
  if (metrics_) metrics_->RecordStreamSession(blocked);
  if (result.cancelled) {
    log::Info("pipeline", "client cancelled stream", "client=" + client_id);
    result.verdict = "CANCELLED";
    Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
    return result;
  }

  std::string finish = "stop";
  if (blocked) {
    finish = "content_filter";
  } else if (upstream_source && !upstream_source->finish_reason().empty()) {
    finish = upstream_source->finish_reason();
  }
  send(BuildStreamChunk(id, request.model, created, "", finish));
  send(kStreamDoneFrame);

  if (blocked) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kOutputBlocked);
    result.verdict = "OUTPUT_BLOCKED: " + sanitized.sanitizer().BlockReason();
  } else {
    bool redacted = input.redacted || sanitized.sanitizer().Redacted();
    if (metrics_) {
      metrics_->RecordOutcome(redacted ? Outcome::kRedacted : Outcome::kPassed);
    }
    result.verdict = redacted ? "REDACTED" : "PASSED";
  }
  Audit(client_id, input, result.verdict, ElapsedMs(start), metadata);
  return result;
}

}  // namespace sentinel
