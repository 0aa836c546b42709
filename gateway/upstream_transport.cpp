#include "gateway/upstream_transport.h"

#include "server/logging/logger.h"

namespace sentinel {

void SseParser::Feed(const std::string& bytes) {
  buffer_ += bytes;
  std::size_t start = 0;
  std::size_t newline;
  while ((newline = buffer_.find('\n', start)) != std::string::npos) {
    HandleLine(buffer_.substr(start, newline - start));
    start = newline + 1;
  }
  buffer_.erase(0, start);
}

void SseParser::Finish() {
  if (!buffer_.empty()) {
    HandleLine(buffer_);
    buffer_.clear();
  }
  HandleLine("");
}

void SseParser::HandleLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.empty()) {
    if (has_data_) {
      events_.push_back(std::move(data_));
      data_.clear();
      has_data_ = false;
    }
    return;
  }
  if (line.front() == ':') {
    return;
  }
  if (line.rfind("data:", 0) != 0) {
    return;
  }
  std::string value = line.substr(5);
  if (!value.empty() && value.front() == ' ') {
    value.erase(0, 1);
  }
  if (has_data_) {
    data_ += "\n";
  }
  data_ += value;
  has_data_ = true;
}

bool SseParser::NextEvent(std::string* data) {
  if (events_.empty()) {
    return false;
  }
  *data = std::move(events_.front());
  events_.pop_front();
  return true;
}

namespace {

class HttpUpstreamStream : public UpstreamStream {
 public:
  explicit HttpUpstreamStream(std::unique_ptr<HttpStream> stream)
      : stream_(std::move(stream)) {}

  int Status() const override { return stream_->status(); }

  bool NextEvent(std::string* data) override {
    while (!parser_.NextEvent(data)) {
      if (eof_) {
        return false;
      }
      std::string chunk;
      if (stream_->Read(&chunk)) {
        parser_.Feed(chunk);
      } else {
        eof_ = true;
        parser_.Finish();
      }
    }
    return true;
  }

  std::string ReadBody() override {
    eof_ = true;
    return stream_->ReadAll();
  }

  void Close() override {
    eof_ = true;
    stream_->Close();
  }

 private:
  std::unique_ptr<HttpStream> stream_;
  SseParser parser_;
  bool eof_{false};
};

}  // namespace

HttpUpstreamTransport::HttpUpstreamTransport(int timeout_ms)
    : client_(timeout_ms) {}

HttpResponse HttpUpstreamTransport::Post(const std::string& url,
                                         const std::string& body,
                                         const HeaderMap& headers) {
  log::Debug("upstream", "POST " + url);
  return client_.Post(url, body, headers);
}

std::unique_ptr<UpstreamStream> HttpUpstreamTransport::OpenStream(
    const std::string& url, const std::string& body,
    const HeaderMap& headers) {
  log::Debug("upstream", "POST (stream) " + url);
  auto request_headers = headers;
  request_headers["Accept"] = "text/event-stream";
  return std::make_unique<HttpUpstreamStream>(
      client_.OpenStream("POST", url, body, request_headers));
}

}  // namespace sentinel
