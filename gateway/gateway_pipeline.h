#pragma once

#include "audit/audit_logger.h"
#include "gateway/canonical.h"
#include "gateway/provider_router.h"
#include "gateway/upstream_transport.h"
#include "guardrails/engine_handle.h"
#include "guardrails/stream_sanitizer.h"
#include "server/limits/rate_limiter.h"
#include "server/metrics/metrics.h"

#include <functional>
#include <memory>
#include <string>

namespace sentinel {

struct GatewayOptions {
  // Answer locally instead of calling a provider.
  bool mock_upstream{false};
  StreamSanitizerOptions stream;
};

struct GatewayResult {
  int status{200};
  json body;
  std::string verdict;  // Audit label.
};

// Receives one SSE frame. Returns false once the client has gone away.
using StreamWriter = std::function<bool(const std::string& frame)>;

struct StreamResult {
  // False when the request was refused before any frame was written; the
  // caller then sends `status` / `error_body` as a plain JSON response.
  bool started{false};
  bool cancelled{false};
  int status{200};
  json error_body;
  std::string verdict;
};

// GatewayPipeline runs one request end to end:
//   admission -> validate input -> route -> translate -> upstream ->
//   translate back -> validate output -> audit.
// One engine snapshot is taken per request and used for both directions.
//
// Thread safety: Handle/HandleStream may run concurrently.
class GatewayPipeline {
 public:
  GatewayPipeline(std::shared_ptr<EngineHandle> engines,
                  std::shared_ptr<const ProviderRouter> router,
                  std::shared_ptr<UpstreamTransport> transport,
                  std::shared_ptr<AuditSink> audit,
                  std::shared_ptr<GatewayMetrics> metrics,
                  GatewayOptions options = {});

  // Must be set before serving; not synchronized with in-flight requests.
  void SetAdmissionHook(AdmissionHook hook) { admission_ = std::move(hook); }

  GatewayResult Handle(const std::string& client_id,
                       const CanonicalRequest& request);

  StreamResult HandleStream(const std::string& client_id,
                            const CanonicalRequest& request,
                            const StreamWriter& write);

  EngineHandle& engines() { return *engines_; }

 private:
  struct InputCheck {
    bool blocked{false};
    bool redacted{false};
    std::string reason;
    std::string original_text;
    std::string sanitized_text;
    CanonicalRequest request;  // With redacted contents.
  };

  InputCheck CheckInput(const GuardrailEngine& engine,
                        const CanonicalRequest& request) const;
  bool Admit(const std::string& client_id);
  CanonicalResponse MockResponse(const CanonicalRequest& request) const;
  void Audit(const std::string& client_id, const InputCheck& input,
             const std::string& verdict, double latency_ms,
             json metadata) const;

  std::shared_ptr<EngineHandle> engines_;
  std::shared_ptr<const ProviderRouter> router_;
  std::shared_ptr<UpstreamTransport> transport_;
  std::shared_ptr<AuditSink> audit_;
  std::shared_ptr<GatewayMetrics> metrics_;
  GatewayOptions options_;
  AdmissionHook admission_;
};

// {"error": {...}} bodies shared with the HTTP layer.
json PolicyViolationBody(const std::string& prefix, const std::string& reason);
json RateLimitedBody();
json InvalidRequestBody(const std::string& message);

}  // namespace sentinel
