#include "guardrails/stream_sanitizer.h"

#include "server/logging/logger.h"
#include "server/text/utf8.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sentinel {

namespace {

// Each candidate costs two extra scans.
constexpr int kMaxCutAttempts = 4;

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }

}  // namespace

StreamSanitizer::StreamSanitizer(std::shared_ptr<const GuardrailEngine> engine,
                                 StreamSanitizerOptions options)
    : engine_(std::move(engine)), options_(std::move(options)) {
  tail_ = options_.tail_bytes > 0 ? options_.tail_bytes
                                  : engine_->MaxMatchLength();
  if (tail_ == 0) {
    tail_ = 1;
  }
  options_.max_pending_bytes = std::max(options_.max_pending_bytes, 2 * tail_);
}

std::vector<std::string> StreamSanitizer::Process(const std::string& delta) {
  std::vector<std::string> out;
  if (finished_ || blocked_) {
    return out;
  }
  pending_ += delta;
  GuardrailVerdict verdict = engine_->Validate(pending_);
  if (verdict.action == GuardrailAction::kBlocked) {
    Block(verdict, &out);
    return out;
  }
  if (pending_.size() <= tail_) {
    return out;
  }
  GuardrailVerdict prefix;
  std::size_t cut = FindSafeCut(verdict.sanitized_text, &prefix);
  if (cut == 0 && pending_.size() > options_.max_pending_bytes) {
    cut = utf8::Boundary(pending_, pending_.size() - tail_);
    log::Debug("stream", "forced release without a safe cut",
               "pending=" + std::to_string(pending_.size()));
    if (cut > 0) {
      prefix = engine_->Validate(pending_.substr(0, cut));
    }
  }
  if (cut > 0) {
    Release(cut, std::move(prefix), &out);
  }
  return out;
}

std::size_t StreamSanitizer::FindSafeCut(const std::string& whole_sanitized,
                                         GuardrailVerdict* prefix_out) const {
  std::size_t limit = pending_.size() - tail_;
  int attempts = 0;
  for (std::size_t cut = limit; cut > 0 && attempts < kMaxCutAttempts; --cut) {
    if (!IsSpace(pending_[cut - 1])) {
      continue;
    }
    ++attempts;
    GuardrailVerdict prefix = engine_->Validate(pending_.substr(0, cut));
    if (prefix.action == GuardrailAction::kBlocked) {
      continue;
    }
    GuardrailVerdict suffix = engine_->Validate(pending_.substr(cut));
    if (prefix.sanitized_text + suffix.sanitized_text == whole_sanitized) {
      *prefix_out = std::move(prefix);
      return cut;
    }
  }
  return 0;
}

void StreamSanitizer::Release(std::size_t cut, GuardrailVerdict prefix,
                              std::vector<std::string>* out) {
  if (prefix.action == GuardrailAction::kBlocked) {
    Block(prefix, out);
    return;
  }
  if (prefix.action == GuardrailAction::kRedacted) {
    redacted_ = true;
  }
  if (!prefix.sanitized_text.empty()) {
    out->push_back(std::move(prefix.sanitized_text));
  }
  pending_.erase(0, cut);
}

void StreamSanitizer::Block(const GuardrailVerdict& verdict,
                            std::vector<std::string>* out) {
  blocked_ = true;
  block_reason_ = verdict.reason;
  pending_.clear();
  log::Info("stream", "stream blocked", "reason=" + verdict.reason);
  out->push_back(options_.block_marker);
}

std::vector<std::string> StreamSanitizer::Flush() {
  std::vector<std::string> out;
  if (finished_) {
    return out;
  }
  finished_ = true;
  if (blocked_ || pending_.empty()) {
    return out;
  }
  GuardrailVerdict verdict = engine_->Validate(pending_);
  if (verdict.action == GuardrailAction::kBlocked) {
    Block(verdict, &out);
    return out;
  }
  if (verdict.action == GuardrailAction::kRedacted) {
    redacted_ = true;
  }
  if (!verdict.sanitized_text.empty()) {
    out.push_back(std::move(verdict.sanitized_text));
  }
  pending_.clear();
  return out;
}

void StreamSanitizer::Cancel() {
  pending_.clear();
  finished_ = true;
}

SanitizedStream::SanitizedStream(std::unique_ptr<DeltaSource> source,
                                 std::shared_ptr<const GuardrailEngine> engine,
                                 StreamSanitizerOptions options)
    : source_(std::move(source)),
      sanitizer_(std::move(engine), std::move(options)) {}

SanitizedStream::~SanitizedStream() { Close(); }

void SanitizedStream::Enqueue(std::vector<std::string> fragments) {
  for (auto& fragment : fragments) {
    if (!fragment.empty()) {
      ready_.push_back(std::move(fragment));
    }
  }
}

bool SanitizedStream::Next(std::string* fragment) {
  while (ready_.empty()) {
    if (closed_ || sanitizer_.Finished()) {
      return false;
    }
    std::string delta;
    if (source_->Next(&delta)) {
      Enqueue(sanitizer_.Process(delta));
    } else {
      Enqueue(sanitizer_.Flush());
    }
  }
  *fragment = std::move(ready_.front());
  ready_.pop_front();
  return true;
}

void SanitizedStream::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  ready_.clear();
  if (!sanitizer_.Finished()) {
    sanitizer_.Cancel();
  }
  if (source_) {
    source_->Close();
  }
}

}  // namespace sentinel
