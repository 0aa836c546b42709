#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace sentinel {
namespace {
struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    char *end = nullptr;
    long port = std::strtol(host_port.c_str() + colon + 1, &end, 10);
    if (end == host_port.c_str() + colon + 1 || *end != '\0' || port <= 0 ||
        port > 65535) {
      throw HttpError("invalid URL port: " + url);
    }
    parsed.port = static_cast<int>(port);
  }
  if (parsed.host.empty()) {
    throw HttpError("invalid URL host: " + url);
  }
  return parsed;
}

bool IsTimeoutErrno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK || err == EINPROGRESS ||
         err == ETIMEDOUT;
}

int CreateSocket(const ParsedUrl &parsed, int timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw HttpError("failed to resolve host " + parsed.host);
  }
  struct timeval tv;
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  int sock = -1;
  bool timed_out = false;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    // SO_SNDTIMEO also bounds connect() on Linux.
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    timed_out = timed_out || IsTimeoutErrno(errno);
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1) {
    if (timed_out) {
      throw HttpTimeoutError("connect to " + parsed.host + " timed out");
    }
    throw HttpError("failed to connect to " + parsed.host);
  }
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  request << "Content-Type: application/json\r\n";
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string Trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r");
  return value.substr(begin, end - begin + 1);
}
} // namespace

bool ChunkedDecoder::Feed(const char *data, std::size_t size,
                          std::string *out) {
  std::size_t i = 0;
  while (i < size && state_ != State::kDone) {
    switch (state_) {
    case State::kSize: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > 1024) {
          return false;
        }
        break;
      }
      std::string hex = Trim(line_.substr(0, line_.find(';')));
      line_.clear();
      if (hex.empty() || hex.size() > 16 ||
          !std::all_of(hex.begin(), hex.end(),
                       [](unsigned char ch) { return std::isxdigit(ch); })) {
        return false;
      }
      remaining_ = static_cast<std::size_t>(std::strtoull(hex.c_str(), nullptr, 16));
      state_ = remaining_ == 0 ? State::kTrailer : State::kData;
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, size - i);
      out->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataCrlf;
      }
      break;
    }
    case State::kDataCrlf: {
      char c = data[i++];
      if (c == '\r') {
        break;
      }
      if (c != '\n') {
        return false;
      }
      state_ = State::kSize;
      break;
    }
    case State::kTrailer: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        break;
      }
      bool blank = Trim(line_).empty();
      line_.clear();
      if (blank) {
        state_ = State::kDone;
      }
      break;
    }
    case State::kDone:
      break;
    }
  }
  return true;
}

bool ParseResponseHead(const std::string &head, int *status,
                       std::map<std::string, std::string> *headers) {
  std::istringstream lines(head);
  std::string status_line;
  if (!std::getline(lines, status_line)) {
    return false;
  }
  if (status_line.rfind("HTTP/", 0) != 0) {
    return false;
  }
  auto space = status_line.find(' ');
  if (space == std::string::npos) {
    return false;
  }
  char *end = nullptr;
  long code = std::strtol(status_line.c_str() + space + 1, &end, 10);
  if (end == status_line.c_str() + space + 1 || code < 100 || code > 599) {
    return false;
  }
  *status = static_cast<int>(code);
  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    (*headers)[Lower(Trim(line.substr(0, colon)))] =
        Trim(line.substr(colon + 1));
  }
  return true;
}

HttpClient::HttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : 30000) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

std::unique_ptr<HttpStream>
HttpClient::OpenStream(const std::string &method, const std::string &url,
                       const std::string &body,
                       const std::map<std::string, std::string> &headers) const {
  auto stream =
      std::make_unique<HttpStream>(this, SendRaw(method, url, body, headers));
  stream->ReadHead();
  return stream;
}

HttpClient::RawConnection
HttpClient::SendRaw(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  RawConnection conn;
  conn.sock = CreateSocket(parsed, timeout_ms_);
  auto payload = BuildRequest(parsed, method, body, headers);
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();

  auto close_connection = [&](const std::string &message) {
    bool timed_out = IsTimeoutErrno(errno);
    CloseRaw(conn);
    if (timed_out) {
      throw HttpTimeoutError(message + " (timed out)");
    }
    throw HttpError(message);
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_connection("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      close_connection("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(conn.ssl, parsed.host.c_str());
#endif
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      close_connection("TLS handshake with " + parsed.host + " failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      close_connection("TLS certificate verification failed for " +
                       parsed.host);
    }
    while (send_remaining > 0) {
      int sent =
          SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        close_connection("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  } else {
    while (send_remaining > 0) {
      ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        close_connection("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  }

  return conn;
}

ssize_t HttpClient::RecvRaw(RawConnection &conn, char *buffer,
                            std::size_t length) const {
  if (conn.ssl) {
    while (true) {
      int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
          err == SSL_ERROR_SYSCALL) {
        // Blocking socket: a retry request only surfaces when SO_RCVTIMEO
        // fires.
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          throw HttpTimeoutError("upstream read timed out");
        }
        if (err != SSL_ERROR_SYSCALL) {
          continue;
        }
        // Peer closed without close_notify; treat as end of stream.
        return received == 0 ? 0 : -1;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      throw HttpTimeoutError("upstream read timed out");
    }
    return received;
  }
}

void HttpClient::CloseRaw(RawConnection &conn) const {
  if (conn.ssl) {
    SSL_shutdown(conn.ssl);
    SSL_free(conn.ssl);
    conn.ssl = nullptr;
  }
  if (conn.sock >= 0) {
    ::close(conn.sock);
    conn.sock = -1;
  }
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto stream = OpenStream(method, url, body, headers);
  HttpResponse response;
  response.status = stream->status();
  response.headers = stream->headers();
  response.body = stream->ReadAll();
  return response;
}

HttpStream::HttpStream(const HttpClient *client,
                       HttpClient::RawConnection conn)
    : client_(client), conn_(conn) {}

HttpStream::~HttpStream() { Close(); }

void HttpStream::Close() {
  finished_ = true;
  client_->CloseRaw(conn_);
}

void HttpStream::ReadHead() {
  std::string buffer;
  std::size_t header_end = std::string::npos;
  char chunk[4096];
  while ((header_end = buffer.find("\r\n\r\n")) == std::string::npos) {
    ssize_t received = client_->RecvRaw(conn_, chunk, sizeof(chunk));
    if (received <= 0) {
      Close();
      throw HttpError("connection closed before response head");
    }
    buffer.append(chunk, static_cast<std::size_t>(received));
    if (buffer.size() > 64 * 1024) {
      Close();
      throw HttpError("response head too large");
    }
  }
  if (!ParseResponseHead(buffer.substr(0, header_end), &status_, &headers_)) {
    Close();
    throw HttpError("malformed response status line");
  }
  body_prefix_ = buffer.substr(header_end + 4);

  auto te = headers_.find("transfer-encoding");
  chunked_ = te != headers_.end() &&
             Lower(te->second).find("chunked") != std::string::npos;
  auto cl = headers_.find("content-length");
  if (!chunked_ && cl != headers_.end()) {
    content_remaining_ = std::strtoll(cl->second.c_str(), nullptr, 10);
    if (content_remaining_ <= 0) {
      content_remaining_ = 0;
      finished_ = true;
    }
  }
  if (status_ == 204 || status_ == 304) {
    finished_ = true;
  }
}

void HttpStream::Consume(const char *data, std::size_t size,
                         std::string *out) {
  if (chunked_) {
    if (!decoder_.Feed(data, size, out)) {
      throw HttpError("malformed chunked response body");
    }
    if (decoder_.Done()) {
      finished_ = true;
    }
    return;
  }
  if (content_remaining_ >= 0) {
    auto take = std::min<std::size_t>(
        size, static_cast<std::size_t>(content_remaining_));
    out->append(data, take);
    content_remaining_ -= static_cast<long long>(take);
    if (content_remaining_ == 0) {
      finished_ = true;
    }
    return;
  }
  out->append(data, size);
}

bool HttpStream::Read(std::string *chunk) {
  chunk->clear();
  if (!body_prefix_.empty()) {
    std::string prefix;
    prefix.swap(body_prefix_);
    Consume(prefix.data(), prefix.size(), chunk);
    if (!chunk->empty()) {
      return true;
    }
  }
  char buffer[4096];
  while (!finished_) {
    ssize_t received = client_->RecvRaw(conn_, buffer, sizeof(buffer));
    if (received < 0) {
      throw HttpError("failed to read response body");
    }
    if (received == 0) {
      bool truncated = (chunked_ && !decoder_.Done()) || content_remaining_ > 0;
      finished_ = true;
      if (truncated) {
        throw HttpError("connection closed mid-response");
      }
      break;
    }
    Consume(buffer, static_cast<std::size_t>(received), chunk);
    if (!chunk->empty()) {
      return true;
    }
  }
  return !chunk->empty();
}

std::string HttpStream::ReadAll() {
  std::string body;
  std::string chunk;
  while (Read(&chunk)) {
    body += chunk;
  }
  return body;
}

} // namespace sentinel
