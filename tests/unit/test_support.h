#pragma once

// In-process fakes shared by the unit tests. Nothing here touches the network.

#include "audit/audit_logger.h"
#include "gateway/upstream_transport.h"
#include "guardrails/embedding_backend.h"
#include "guardrails/guardrail_engine.h"
#include "policy/profile.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sentinel {
namespace testing {

inline Profile ProfileFromYaml(const std::string& yaml) {
  Profile profile;
  std::string error;
  if (!ParseProfileYaml(yaml, &profile, &error)) {
    throw std::runtime_error("bad test profile: " + error);
  }
  return profile;
}

inline std::shared_ptr<const GuardrailEngine> EngineFromYaml(
    const std::string& yaml,
    std::shared_ptr<const EmbeddingBackend> embedder = nullptr) {
  return GuardrailEngine::Build(ProfileFromYaml(yaml), std::move(embedder));
}

// Bag-of-words embedding over a fixed vocabulary: one dimension per word,
// plus a small constant so no vector is all zeros.
class FakeEmbeddingBackend : public EmbeddingBackend {
 public:
  explicit FakeEmbeddingBackend(std::vector<std::string> vocabulary)
      : vocabulary_(std::move(vocabulary)) {}

  std::vector<Embedding> Embed(
      const std::vector<std::string>& texts) const override {
    ++calls_;
    if (fail_) {
      throw std::runtime_error("embedding service unavailable");
    }
    std::vector<Embedding> out;
    for (const auto& text : texts) {
      std::string lowered = text;
      std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      Embedding vec(vocabulary_.size() + 1, 0.0f);
      vec[0] = 0.05f;
      for (std::size_t i = 0; i < vocabulary_.size(); ++i) {
        if (lowered.find(vocabulary_[i]) != std::string::npos) {
          vec[i + 1] = 1.0f;
        }
      }
      out.push_back(std::move(vec));
    }
    return out;
  }

  std::string Name() const override { return "fake"; }

  void SetFailing(bool fail) { fail_ = fail; }
  int Calls() const { return calls_.load(); }

 private:
  std::vector<std::string> vocabulary_;
  std::atomic<bool> fail_{false};
  mutable std::atomic<int> calls_{0};
};

class RecordingAuditSink : public AuditSink {
 public:
  void Record(const AuditRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
  }

  std::vector<AuditRecord> Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<AuditRecord> records_;
};

class FakeUpstreamStream : public UpstreamStream {
 public:
  FakeUpstreamStream(int status, std::deque<std::string> events,
                     std::string body, bool throw_at_end)
      : status_(status),
        events_(std::move(events)),
        body_(std::move(body)),
        throw_at_end_(throw_at_end) {}

  int Status() const override { return status_; }

  bool NextEvent(std::string* data) override {
    if (closed_) {
      return false;
    }
    if (events_.empty()) {
      if (throw_at_end_) {
        throw HttpError("connection reset by peer");
      }
      return false;
    }
    *data = events_.front();
    events_.pop_front();
    return true;
  }

  std::string ReadBody() override { return body_; }
  void Close() override { closed_ = true; }

 private:
  int status_;
  std::deque<std::string> events_;
  std::string body_;
  bool throw_at_end_;
  bool closed_{false};
};

// Scripted transport. Records every call; replies with the configured
// response, stream events, or exception.
class FakeTransport : public UpstreamTransport {
 public:
  enum class Failure { kNone, kTimeout, kConnect };

  struct Call {
    std::string url;
    std::string body;
    HeaderMap headers;
  };

  HttpResponse Post(const std::string& url, const std::string& body,
                    const HeaderMap& headers) override {
    calls.push_back({url, body, headers});
    Throw();
    return response;
  }

  std::unique_ptr<UpstreamStream> OpenStream(
      const std::string& url, const std::string& body,
      const HeaderMap& headers) override {
    calls.push_back({url, body, headers});
    Throw();
    return std::make_unique<FakeUpstreamStream>(
        response.status, stream_events, response.body, stream_breaks);
  }

  HttpResponse response{200, {}, "{}"};
  std::deque<std::string> stream_events;
  bool stream_breaks{false};
  Failure failure{Failure::kNone};
  std::vector<Call> calls;

 private:
  void Throw() const {
    if (failure == Failure::kTimeout) {
      throw HttpTimeoutError("read timed out after 100 ms");
    }
    if (failure == Failure::kConnect) {
      throw HttpError("connect failed: connection refused");
    }
  }
};

}  // namespace testing
}  // namespace sentinel
