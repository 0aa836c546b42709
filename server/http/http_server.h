#pragma once

#include "audit/audit_queue.h"
#include "gateway/gateway_pipeline.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace sentinel {

// Request line and headers of one inbound HTTP/1.1 request. Header names are
// lower-cased.
struct HttpRequestHead {
  std::string method;
  std::string path;
  std::map<std::string, std::string> headers;
};

bool ParseRequestHead(const std::string& head, HttpRequestHead* out);

// Names (file stems) of the *.yaml / *.yml profiles inside `dir`, sorted.
// Hidden files are skipped.
std::vector<std::string> ListProfiles(const std::string& dir);

// Maps a profile name to a file inside `dir`. Only plain names are accepted:
// separators, "..", and hidden names are rejected.
bool ResolveProfilePath(const std::string& dir, const std::string& name,
                        std::string* path, std::string* error);

class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  struct Options {
    std::string host{"0.0.0.0"};
    int port{8080};
    int num_workers{4};
    std::size_t max_body_bytes{1024 * 1024};
    std::string profiles_dir{"config/profiles"};
    TlsConfig tls;
  };

  // `audit_queue` may be null; it only feeds the dropped-records gauge.
  HttpServer(Options options, std::shared_ptr<GatewayPipeline> pipeline,
             std::shared_ptr<GatewayMetrics> metrics,
             std::shared_ptr<AuditQueue> audit_queue);
  ~HttpServer();

  void Start();
  void Stop();

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
    std::string peer;
    bool responded{false};  // Set once any bytes went to the client.
  };

  void Run();
  void WorkerLoop();
  // Never throws: failures inside ServeClient answer 500.
  void HandleClient(ClientSession& session);
  void ServeClient(ClientSession& session);

  void HandleChat(ClientSession& session, const std::string& body);
  void HandleListProfiles(ClientSession& session);
  void HandleSwitchProfile(ClientSession& session, const std::string& body);
  void HandleMetrics(ClientSession& session);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  Options options_;
  std::shared_ptr<GatewayPipeline> pipeline_;
  std::shared_ptr<GatewayMetrics> metrics_;
  std::shared_ptr<AuditQueue> audit_queue_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace sentinel
