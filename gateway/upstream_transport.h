#pragma once

#include "net/http_client.h"

#include <deque>
#include <map>
#include <memory>
#include <string>

namespace sentinel {

using HeaderMap = std::map<std::string, std::string>;

// Incremental Server-Sent Events parser. Only `data:` fields matter to the
// gateway; multi-line data is joined with '\n', comments and other fields are
// skipped.
class SseParser {
 public:
  void Feed(const std::string& bytes);
  // Dispatches a trailing event that was not terminated by a blank line.
  void Finish();
  bool NextEvent(std::string* data);

 private:
  void HandleLine(std::string line);

  std::string buffer_;
  std::string data_;
  bool has_data_{false};
  std::deque<std::string> events_;
};

// A streaming upstream response.
class UpstreamStream {
 public:
  virtual ~UpstreamStream() = default;
  virtual int Status() const = 0;
  // Next SSE data payload; false at end of body.
  virtual bool NextEvent(std::string* data) = 0;
  // Whole remaining body, for non-2xx responses.
  virtual std::string ReadBody() = 0;
  virtual void Close() = 0;
};

// The gateway's only I/O seam. Implementations throw HttpError or
// HttpTimeoutError on transport failure and return non-2xx statuses as data.
class UpstreamTransport {
 public:
  virtual ~UpstreamTransport() = default;
  virtual HttpResponse Post(const std::string& url, const std::string& body,
                            const HeaderMap& headers) = 0;
  virtual std::unique_ptr<UpstreamStream> OpenStream(
      const std::string& url, const std::string& body,
      const HeaderMap& headers) = 0;
};

class HttpUpstreamTransport : public UpstreamTransport {
 public:
  explicit HttpUpstreamTransport(int timeout_ms);

  HttpResponse Post(const std::string& url, const std::string& body,
                    const HeaderMap& headers) override;
  std::unique_ptr<UpstreamStream> OpenStream(
      const std::string& url, const std::string& body,
      const HeaderMap& headers) override;

 private:
  HttpClient client_;
};

}  // namespace sentinel
