#include "server/config/gateway_config.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace sentinel {

namespace {

template <typename T>
void Read(const YAML::Node& node, const char* key, T* out) {
  if (node && node[key]) {
    *out = node[key].as<T>();
  }
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool ParseBool(const std::string& value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

bool ParseInt(const char* name, const char* text, int* out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0') {
    log::Warn("config", std::string("ignoring non-numeric ") + name,
              std::string("value=") + text);
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

void ReadProvider(const YAML::Node& providers, const char* name,
                  std::string* api_key, std::string* endpoint) {
  if (!providers || !providers[name]) {
    return;
  }
  Read(providers[name], "api_key", api_key);
  Read(providers[name], "endpoint", endpoint);
}

}  // namespace

bool LoadGatewayConfig(const std::string& path, GatewayConfig* config,
                       std::string* error) {
  if (!std::filesystem::exists(path)) {
    log::Warn("config", "config file not found; using defaults",
              "path=" + path);
    return true;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);

    const auto server = root["server"];
    Read(server, "host", &config->host);
    Read(server, "http_port", &config->http_port);
    Read(server, "http_workers", &config->http_workers);
    Read(server, "max_body_bytes", &config->max_body_bytes);
    if (server && server["tls"]) {
      Read(server["tls"], "enabled", &config->tls_enabled);
      Read(server["tls"], "cert_path", &config->tls_cert_path);
      Read(server["tls"], "key_path", &config->tls_key_path);
    }

    const auto guardrails = root["guardrails"];
    Read(guardrails, "profile", &config->profile_path);
    Read(guardrails, "profiles_dir", &config->profiles_dir);

    const auto embedding = root["embedding"];
    Read(embedding, "endpoint", &config->embedding_endpoint);
    Read(embedding, "model", &config->embedding_model);
    Read(embedding, "api_key", &config->embedding_api_key);
    Read(embedding, "timeout_ms", &config->embedding_timeout_ms);

    const auto upstream = root["upstream"];
    Read(upstream, "fallback_endpoint", &config->router.fallback_endpoint);
    Read(upstream, "fallback_api_key",
         &config->router.credentials.fallback_api_key);
    Read(upstream, "timeout_ms", &config->upstream_timeout_ms);
    Read(upstream, "mock", &config->mock_upstream);

    const auto providers = root["providers"];
    auto& creds = config->router.credentials;
    ReadProvider(providers, "openai", &creds.openai_api_key,
                 &config->router.openai_endpoint);
    ReadProvider(providers, "anthropic", &creds.anthropic_api_key,
                 &config->router.anthropic_endpoint);
    ReadProvider(providers, "gemini", &creds.gemini_api_key,
                 &config->router.gemini_base);
    ReadProvider(providers, "xai", &creds.xai_api_key,
                 &config->router.xai_endpoint);

    const auto streaming = root["streaming"];
    Read(streaming, "tail_bytes", &config->streaming.tail_bytes);
    Read(streaming, "max_pending_bytes", &config->streaming.max_pending_bytes);
    Read(streaming, "block_marker", &config->streaming.block_marker);

    const auto audit = root["audit"];
    Read(audit, "path", &config->audit_path);
    Read(audit, "debug", &config->audit_debug);
    Read(audit, "queue_depth", &config->audit_queue_depth);

    Read(root["limits"], "rate_limit_per_minute",
         &config->rate_limit_per_minute);

    const auto logging = root["logging"];
    Read(logging, "format", &config->log_format);
    Read(logging, "level", &config->log_level);
  } catch (const YAML::Exception& ex) {
    if (error) {
      *error = "error parsing config file " + path + ": " + ex.what();
    }
    return false;
  }
  return true;
}

void ApplyEnvOverrides(GatewayConfig* config, const EnvLookup& lookup) {
  auto get = [&](const char* name) -> const char* {
    const char* value = lookup ? lookup(name) : std::getenv(name);
    return (value && *value) ? value : nullptr;
  };

  if (const char* v = get("SENTINEL_HOST")) config->host = v;
  if (const char* v = get("SENTINEL_PORT")) {
    ParseInt("SENTINEL_PORT", v, &config->http_port);
  }
  if (const char* v = get("SENTINEL_HTTP_WORKERS")) {
    ParseInt("SENTINEL_HTTP_WORKERS", v, &config->http_workers);
  }
  if (const char* v = get("SENTINEL_PROFILE")) config->profile_path = v;
  if (const char* v = get("SENTINEL_PROFILES_DIR")) config->profiles_dir = v;
  if (const char* v = get("SENTINEL_FALLBACK_ENDPOINT")) {
    config->router.fallback_endpoint = v;
  }
  if (const char* v = get("SENTINEL_UPSTREAM_TIMEOUT_MS")) {
    ParseInt("SENTINEL_UPSTREAM_TIMEOUT_MS", v, &config->upstream_timeout_ms);
  }
  if (const char* v = get("SENTINEL_MOCK_UPSTREAM")) {
    config->mock_upstream = ParseBool(v);
  }
  if (const char* v = get("SENTINEL_AUDIT_LOG")) config->audit_path = v;
  if (const char* v = get("SENTINEL_AUDIT_DEBUG")) {
    config->audit_debug = ParseBool(v);
  }
  if (const char* v = get("SENTINEL_RATE_LIMIT_PER_MINUTE")) {
    ParseInt("SENTINEL_RATE_LIMIT_PER_MINUTE", v,
             &config->rate_limit_per_minute);
  }
  if (const char* v = get("SENTINEL_EMBEDDING_ENDPOINT")) {
    config->embedding_endpoint = v;
  }
  if (const char* v = get("SENTINEL_LOG_FORMAT")) config->log_format = v;
  if (const char* v = get("SENTINEL_LOG_LEVEL")) config->log_level = v;

  auto& creds = config->router.credentials;
  if (const char* v = get("OPENAI_API_KEY")) creds.openai_api_key = v;
  if (const char* v = get("ANTHROPIC_API_KEY")) creds.anthropic_api_key = v;
  if (const char* v = get("GEMINI_API_KEY")) creds.gemini_api_key = v;
  if (const char* v = get("XAI_API_KEY")) creds.xai_api_key = v;
}

}  // namespace sentinel
