#include "server/http/http_server.h"

#include "gateway/canonical.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace sentinel {

namespace {

namespace fs = std::filesystem;

const char* StatusText(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return status < 400 ? "OK" : "Error";
  }
}

std::string BuildResponse(const std::string& body, int status = 200,
                          const std::string& content_type =
                              "application/json") {
  std::string headers = "HTTP/1.1 " + std::to_string(status) + " " +
                        StatusText(status) + "\r\n";
  headers += "Content-Type: " + content_type + "\r\n";
  headers += "Access-Control-Allow-Origin: *\r\n";
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

std::string BuildJsonResponse(const json& body, int status = 200) {
  // Upstream text can carry invalid UTF-8; never let it throw here.
  return BuildResponse(
      body.dump(-1, ' ', false, json::error_handler_t::replace), status);
}

const char kStreamHeaders[] =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Cache-Control: no-cache\r\n"
    "Access-Control-Allow-Origin: *\r\n"
    "Connection: close\r\n\r\n";

std::string Trim(const std::string& value) {
  auto s = value.find_first_not_of(" \t");
  if (s == std::string::npos) return {};
  auto e = value.find_last_not_of(" \t\r\n");
  return value.substr(s, e - s + 1);
}

bool IsYamlFile(const fs::path& path) {
  auto ext = path.extension().string();
  return ext == ".yaml" || ext == ".yml";
}

}  // namespace

bool ParseRequestHead(const std::string& head, HttpRequestHead* out) {
  auto line_end = head.find("\r\n");
  std::string first_line = head.substr(0, line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos) {
    return false;
  }
  auto path_end = first_line.find(' ', method_end + 1);
  if (path_end == std::string::npos) {
    return false;
  }
  out->method = first_line.substr(0, method_end);
  out->path = first_line.substr(method_end + 1, path_end - method_end - 1);
  auto query = out->path.find('?');
  if (query != std::string::npos) {
    out->path.resize(query);
  }
  out->headers.clear();
  while (line_end != std::string::npos) {
    auto start = line_end + 2;
    line_end = head.find("\r\n", start);
    std::string line = head.substr(
        start, line_end == std::string::npos ? std::string::npos
                                             : line_end - start);
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    out->headers[name] = Trim(line.substr(colon + 1));
  }
  return !out->method.empty() && !out->path.empty();
}

std::vector<std::string> ListProfiles(const std::string& dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    auto stem = it->path().stem().string();
    if (it->is_regular_file(ec) && IsYamlFile(it->path()) &&
        stem.front() != '.') {
      names.push_back(stem);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool ResolveProfilePath(const std::string& dir, const std::string& name,
                        std::string* path, std::string* error) {
  if (name.empty()) {
    *error = "profile_name is required";
    return false;
  }
  if (name.find('/') != std::string::npos ||
      name.find('\\') != std::string::npos || name.front() == '.') {
    *error = "invalid profile_name: " + name;
    return false;
  }
  fs::path base(dir);
  fs::path given(name);
  std::vector<fs::path> candidates;
  if (IsYamlFile(given)) {
    candidates.push_back(base / given);
  } else {
    candidates.push_back(base / (name + ".yaml"));
    candidates.push_back(base / (name + ".yml"));
  }
  std::error_code ec;
  for (const auto& candidate : candidates) {
    if (fs::is_regular_file(candidate, ec)) {
      *path = candidate.string();
      return true;
    }
  }
  *error = "profile not found: " + name;
  return false;
}

HttpServer::HttpServer(Options options,
                       std::shared_ptr<GatewayPipeline> pipeline,
                       std::shared_ptr<GatewayMetrics> metrics,
                       std::shared_ptr<AuditQueue> audit_queue)
    : options_(std::move(options)),
      pipeline_(std::move(pipeline)),
      metrics_(std::move(metrics)),
      audit_queue_(std::move(audit_queue)) {
  if (options_.num_workers <= 0) {
    options_.num_workers = 4;
  }
  const auto& tls = options_.tls;
  if (!tls.enabled) {
    return;
  }
  if (tls.cert_path.empty() || tls.key_path.empty()) {
    log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    return;
  }
  ssl_ctx_ = SSL_CTX_new(TLS_server_method());
  if (!ssl_ctx_) {
    log::Error("http", "failed to initialize TLS context");
    return;
  }
  if (SSL_CTX_use_certificate_file(ssl_ctx_, tls.cert_path.c_str(),
                                   SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS certificate",
               "path=" + tls.cert_path);
  } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls.key_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS key", "path=" + tls.key_path);
  } else {
    tls_enabled_ = true;
    log::Info("http", "TLS enabled", "cert=" + tls.cert_path);
    return;
  }
  SSL_CTX_free(ssl_ctx_);
  ssl_ctx_ = nullptr;
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < options_.num_workers; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Closing the listening socket unblocks accept() in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + options_.host);
    ::close(fd);
    return;
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed", std::strerror(errno));
    ::close(fd);
    return;
  }
  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return;
  }

  server_fd_.store(fd);
  log::Info("http", "listening",
            options_.host + ":" + std::to_string(options_.port));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      break;  // Socket closed by Stop().
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    char peer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer))) {
      session.peer = peer;
    } else {
      session.peer = "unknown";
    }
    if (tls_enabled_) {
      SSL* ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession& session) {
  try {
    ServeClient(session);
  } catch (const std::exception& ex) {
    log::Error("http", "request handler failed",
               "peer=" + session.peer + " error=" + ex.what());
    if (!session.responded) {
      CanonicalError error;
      error.message = "internal gateway error";
      error.code = "internal_error";
      error.type = "server_error";
      SendAll(session, BuildJsonResponse(ErrorBody(error), 500));
    }
  }
}

void HttpServer::ServeClient(ClientSession& session) {
  constexpr std::size_t kMaxHead = 64 * 1024;
  std::string request;
  std::size_t header_end = std::string::npos;
  char buffer[4096];

  // Read until the end-of-headers marker.
  while (header_end == std::string::npos) {
    if (request.size() > kMaxHead) {
      SendAll(session, BuildJsonResponse(
                           InvalidRequestBody("request headers too large"),
                           413));
      return;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    header_end = request.find("\r\n\r\n");
  }

  HttpRequestHead head;
  if (!ParseRequestHead(request.substr(0, header_end), &head)) {
    SendAll(session, BuildJsonResponse(
                         InvalidRequestBody("malformed request line"), 400));
    return;
  }

  std::size_t content_length = 0;
  auto cl = head.headers.find("content-length");
  if (cl != head.headers.end()) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(cl->second.c_str(), &end, 10);
    if (end == cl->second.c_str() || *end != '\0') {
      SendAll(session, BuildJsonResponse(
                           InvalidRequestBody("invalid Content-Length"), 400));
      return;
    }
    content_length = static_cast<std::size_t>(parsed);
  }
  if (content_length > options_.max_body_bytes) {
    SendAll(session, BuildJsonResponse(
                         InvalidRequestBody("request_too_large"), 413));
    return;
  }

  std::string body = request.substr(header_end + 4);
  while (body.size() < content_length) {
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    body.append(buffer, static_cast<std::size_t>(bytes));
  }
  body.resize(content_length);

  log::Debug("http", head.method + " " + head.path, "peer=" + session.peer);

  if (head.method == "OPTIONS") {
    SendAll(session,
            "HTTP/1.1 204 No Content\r\n"
            "Access-Control-Allow-Origin: *\r\n"
            "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
            "Access-Control-Allow-Headers: Content-Type, Authorization\r\n"
            "Content-Length: 0\r\n\r\n");
    return;
  }
  if (head.path == "/v1/chat/completions") {
    if (head.method != "POST") {
      SendAll(session, BuildJsonResponse(
                           InvalidRequestBody("method not allowed"), 405));
      return;
    }
    HandleChat(session, body);
    return;
  }
  if (head.path == "/api/profiles" && head.method == "GET") {
    HandleListProfiles(session);
    return;
  }
  if (head.path == "/api/profiles/switch" && head.method == "POST") {
    HandleSwitchProfile(session, body);
    return;
  }
  if (head.path == "/healthz" && head.method == "GET") {
    json payload = {{"status", "ok"},
                    {"profile", pipeline_->engines().ActiveProfileName()}};
    SendAll(session, BuildJsonResponse(payload));
    return;
  }
  if (head.path == "/metrics" && head.method == "GET") {
    HandleMetrics(session);
    return;
  }
  SendAll(session, BuildJsonResponse(InvalidRequestBody("not_found"), 404));
}

void HttpServer::HandleChat(ClientSession& session, const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  CanonicalRequest request;
  std::string error;
  bool ok = false;
  if (parsed.is_discarded()) {
    error = "request body is not valid JSON";
  } else {
    ok = ParseCanonicalRequest(parsed, &request, &error);
  }
  if (!ok) {
    if (metrics_) metrics_->RecordOutcome(Outcome::kInvalidRequest);
    SendAll(session, BuildJsonResponse(InvalidRequestBody(error), 400));
    return;
  }

  if (!request.stream) {
    auto result = pipeline_->Handle(session.peer, request);
    SendAll(session, BuildJsonResponse(result.body, result.status));
    return;
  }

  bool headers_sent = false;
  auto result = pipeline_->HandleStream(
      session.peer, request, [&](const std::string& frame) {
        if (!headers_sent) {
          if (!SendAll(session, kStreamHeaders)) {
            return false;
          }
          headers_sent = true;
        }
        return SendAll(session, frame);
      });
  if (!result.started) {
    SendAll(session, BuildJsonResponse(result.error_body, result.status));
  } else if (result.cancelled) {
    log::Info("http", "client disconnected mid-stream", "peer=" + session.peer);
  }
}

void HttpServer::HandleListProfiles(ClientSession& session) {
  json payload;
  payload["active"] = pipeline_->engines().ActiveProfileName();
  payload["profiles"] = ListProfiles(options_.profiles_dir);
  SendAll(session, BuildJsonResponse(payload));
}

void HttpServer::HandleSwitchProfile(ClientSession& session,
                                     const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object() ||
      !parsed.contains("profile_name") ||
      !parsed["profile_name"].is_string()) {
    SendAll(session, BuildJsonResponse(
                         InvalidRequestBody("profile_name is required"), 400));
    return;
  }
  std::string path;
  std::string error;
  if (!ResolveProfilePath(options_.profiles_dir,
                          parsed["profile_name"].get<std::string>(), &path,
                          &error)) {
    if (metrics_) metrics_->RecordProfileSwitch(false);
    SendAll(session, BuildJsonResponse(InvalidRequestBody(error), 404));
    return;
  }
  bool ok = pipeline_->engines().SwitchFromFile(path, &error);
  if (metrics_) metrics_->RecordProfileSwitch(ok);
  if (!ok) {
    log::Warn("http", "profile switch rejected", error);
    SendAll(session, BuildJsonResponse(InvalidRequestBody(error), 400));
    return;
  }
  json payload = {{"status", "ok"},
                  {"active", pipeline_->engines().ActiveProfileName()}};
  SendAll(session, BuildJsonResponse(payload));
}

void HttpServer::HandleMetrics(ClientSession& session) {
  if (!metrics_) {
    SendAll(session, BuildJsonResponse(
                         InvalidRequestBody("metrics disabled"), 503));
    return;
  }
  if (audit_queue_) {
    metrics_->SetAuditDropped(audit_queue_->Dropped());
  }
  SendAll(session, BuildResponse(metrics_->RenderPrometheus(), 200,
                                 "text/plain; version=0.0.4"));
}

bool HttpServer::SendAll(ClientSession& session, const std::string& payload) {
  session.responded = true;
  const char* data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(
          ::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession& session, char* buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession& session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

}  // namespace sentinel
