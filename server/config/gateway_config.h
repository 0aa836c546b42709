#pragma once

#include "gateway/provider_router.h"
#include "guardrails/stream_sanitizer.h"

#include <cstddef>
#include <functional>
#include <string>

namespace sentinel {

struct GatewayConfig {
  // server
  std::string host{"0.0.0.0"};
  int http_port{8080};
  int http_workers{4};
  std::size_t max_body_bytes{1024 * 1024};
  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;

  // guardrails
  std::string profile_path{"config/profiles/default.yaml"};
  std::string profiles_dir{"config/profiles"};

  // embedding (semantic detector backend); empty endpoint disables it
  std::string embedding_endpoint;
  std::string embedding_model{"text-embedding-3-small"};
  std::string embedding_api_key;
  int embedding_timeout_ms{5000};

  // upstream + providers
  RouterConfig router;
  int upstream_timeout_ms{60000};
  bool mock_upstream{false};

  StreamSanitizerOptions streaming;

  // audit
  std::string audit_path{"logs/audit.jsonl"};
  bool audit_debug{false};
  std::size_t audit_queue_depth{1024};

  // limits
  int rate_limit_per_minute{0};

  // logging
  std::string log_format{"text"};
  std::string log_level{"info"};
};

// Reads `path` into *config. A missing file keeps the defaults and returns
// true; a malformed one returns false with *error set.
bool LoadGatewayConfig(const std::string& path, GatewayConfig* config,
                       std::string* error);

using EnvLookup = std::function<const char*(const char*)>;

// Applies SENTINEL_* and provider credential variables. Values that fail to
// parse are logged and ignored.
void ApplyEnvOverrides(GatewayConfig* config,
                       const EnvLookup& lookup = EnvLookup());

}  // namespace sentinel
