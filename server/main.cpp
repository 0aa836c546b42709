#include "audit/audit_logger.h"
#include "audit/audit_queue.h"
#include "gateway/gateway_pipeline.h"
#include "gateway/provider_router.h"
#include "gateway/upstream_transport.h"
#include "guardrails/embedding_backend.h"
#include "guardrails/engine_handle.h"
#include "server/config/gateway_config.h"
#include "server/http/http_server.h"
#include "server/limits/rate_limiter.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void ConfigureLogging(const sentinel::GatewayConfig& config) {
  sentinel::log::SetJsonMode(config.log_format == "json");
  sentinel::log::Level level;
  if (sentinel::log::ParseLevel(config.log_level, &level)) {
    sentinel::log::SetMinLevel(level);
  } else {
    sentinel::log::Warn("config", "unknown log level; keeping info",
                        "level=" + config.log_level);
  }
}

std::shared_ptr<sentinel::AuditSink> OpenAuditLog(
    const sentinel::GatewayConfig& config,
    std::shared_ptr<sentinel::AuditQueue>* queue) {
  if (config.audit_path.empty()) {
    sentinel::log::Info("audit", "audit log disabled");
    return nullptr;
  }
  std::filesystem::path path(config.audit_path);
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto sink = std::make_shared<sentinel::JsonlAuditSink>(config.audit_path,
                                                          config.audit_debug);
  if (!sink->Enabled()) {
    sentinel::log::Error("audit", "cannot open audit log",
                         "path=" + config.audit_path);
    return nullptr;
  }
  *queue = std::make_shared<sentinel::AuditQueue>(sink,
                                                  config.audit_queue_depth);
  return *queue;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/gateway.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "usage: sentinel-gateway [--config <path>]" << std::endl;
      return 0;
    }
  }

  sentinel::GatewayConfig config;
  std::string error;
  if (!sentinel::LoadGatewayConfig(config_path, &config, &error)) {
    sentinel::log::Error("config", error);
    return 1;
  }
  sentinel::ApplyEnvOverrides(&config);
  ConfigureLogging(config);

  std::shared_ptr<const sentinel::EmbeddingBackend> embedder;
  if (!config.embedding_endpoint.empty()) {
    embedder = std::make_shared<sentinel::HttpEmbeddingBackend>(
        config.embedding_endpoint, config.embedding_model,
        config.embedding_api_key, config.embedding_timeout_ms);
    sentinel::log::Info("server", "semantic detector backend configured",
                        "endpoint=" + config.embedding_endpoint);
  }

  auto engines = std::make_shared<sentinel::EngineHandle>(embedder);
  engines->InitializeFromFile(config.profile_path);
  sentinel::log::Info("server", "active guardrail profile",
                      engines->ActiveProfileName());

  auto router =
      std::make_shared<const sentinel::ProviderRouter>(config.router);
  std::shared_ptr<sentinel::UpstreamTransport> transport;
  if (!config.mock_upstream) {
    transport = std::make_shared<sentinel::HttpUpstreamTransport>(
        config.upstream_timeout_ms);
  } else {
    sentinel::log::Warn("server", "mock upstream mode; no provider calls");
  }

  std::shared_ptr<sentinel::AuditQueue> audit_queue;
  auto audit = OpenAuditLog(config, &audit_queue);
  auto metrics = std::make_shared<sentinel::GatewayMetrics>();

  sentinel::GatewayOptions options;
  options.mock_upstream = config.mock_upstream;
  options.stream = config.streaming;

  std::shared_ptr<sentinel::GatewayPipeline> pipeline;
  try {
    pipeline = std::make_shared<sentinel::GatewayPipeline>(
        engines, router, transport, audit, metrics, options);
  } catch (const std::invalid_argument& ex) {
    sentinel::log::Error("server", "cannot build gateway pipeline", ex.what());
    return 1;
  }

  auto limiter =
      std::make_shared<sentinel::RateLimiter>(config.rate_limit_per_minute);
  if (limiter->Enabled()) {
    pipeline->SetAdmissionHook(sentinel::MakeRateLimitHook(limiter));
    sentinel::log::Info(
        "server", "rate limiting enabled",
        "rpm=" + std::to_string(config.rate_limit_per_minute));
  }

  sentinel::HttpServer::Options server_options;
  server_options.host = config.host;
  server_options.port = config.http_port;
  server_options.num_workers = config.http_workers;
  server_options.max_body_bytes = config.max_body_bytes;
  server_options.profiles_dir = config.profiles_dir;
  server_options.tls.enabled = config.tls_enabled;
  server_options.tls.cert_path = config.tls_cert_path;
  server_options.tls.key_path = config.tls_key_path;

  sentinel::HttpServer server(server_options, pipeline, metrics, audit_queue);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  server.Start();
  sentinel::log::Info("server", "sentinel-gateway started",
                      config.host + ":" + std::to_string(config.http_port));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  sentinel::log::Info("server", "shutting down");
  server.Stop();
  if (audit_queue) {
    audit_queue->Stop();
  }
  return 0;
}
