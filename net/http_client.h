#pragma once

#include <sys/types.h>

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace sentinel {

// Transport-level failure: DNS, connect, TLS, send/recv, malformed framing.
class HttpError : public std::runtime_error {
public:
  explicit HttpError(const std::string &message)
      : std::runtime_error(message) {}
};

// The configured connect/read timeout elapsed.
class HttpTimeoutError : public HttpError {
public:
  explicit HttpTimeoutError(const std::string &message)
      : HttpError(message) {}
};

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers; // lower-cased names
  std::string body;
};

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedDecoder {
public:
  // Appends decoded payload bytes to *out. Returns false on malformed framing.
  bool Feed(const char *data, std::size_t size, std::string *out);
  bool Done() const { return state_ == State::kDone; }

private:
  enum class State { kSize, kData, kDataCrlf, kTrailer, kDone };
  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

// Parses "HTTP/1.1 200 OK\r\nName: value\r\n..." (without the blank line).
bool ParseResponseHead(const std::string &head, int *status,
                       std::map<std::string, std::string> *headers);

class HttpStream;

class HttpClient {
public:
  struct RawConnection {
    int sock{-1};
    SSL *ssl{nullptr};
  };

  explicit HttpClient(int timeout_ms = 30000);
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;

  // Sends the request and reads the response head. Body bytes are pulled
  // through HttpStream::Read as they arrive.
  std::unique_ptr<HttpStream>
  OpenStream(const std::string &method, const std::string &url,
             const std::string &body,
             const std::map<std::string, std::string> &headers) const;

  RawConnection
  SendRaw(const std::string &method, const std::string &url,
          const std::string &body,
          const std::map<std::string, std::string> &headers) const;
  // Throws HttpTimeoutError when the read timeout elapses.
  ssize_t RecvRaw(RawConnection &conn, char *buffer, std::size_t length) const;
  void CloseRaw(RawConnection &conn) const;

  int timeout_ms() const { return timeout_ms_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  int timeout_ms_;
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

// Response whose body is consumed incrementally. Owns the connection.
class HttpStream {
public:
  HttpStream(const HttpClient *client, HttpClient::RawConnection conn);
  ~HttpStream();
  HttpStream(const HttpStream &) = delete;
  HttpStream &operator=(const HttpStream &) = delete;

  int status() const { return status_; }
  const std::map<std::string, std::string> &headers() const {
    return headers_;
  }

  // Fills *chunk with the next slice of decoded body. Returns false once the
  // body is exhausted.
  bool Read(std::string *chunk);
  std::string ReadAll();
  void Close();

private:
  friend class HttpClient;
  void ReadHead();
  void Consume(const char *data, std::size_t size, std::string *out);

  const HttpClient *client_;
  HttpClient::RawConnection conn_;
  int status_{0};
  std::map<std::string, std::string> headers_;
  std::string body_prefix_;
  bool chunked_{false};
  long long content_remaining_{-1};
  bool finished_{false};
  ChunkedDecoder decoder_;
};

} // namespace sentinel
