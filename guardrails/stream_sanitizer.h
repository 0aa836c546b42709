#pragma once

#include "guardrails/guardrail_engine.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace sentinel {

struct StreamSanitizerOptions {
  // Bytes held back after every release. 0 selects the engine's
  // MaxMatchLength(), the longest span any detector can match.
  std::size_t tail_bytes{0};
  // Forces a release once pending text grows past this without a safe cut.
  std::size_t max_pending_bytes{16 * 1024};
  std::string block_marker{"[blocked by security policy]"};
};

// StreamSanitizer applies one engine to a live sequence of text deltas.
//
// Each Process() call re-scans the whole pending window so violations split
// across deltas are still caught. Text is only released up to a whitespace
// cut at least `tail_bytes` from the end, and only when sanitizing the two
// halves separately gives the same text as sanitizing the window whole.
// Once blocked, the marker is emitted once and every later delta is consumed
// without output.
//
// Single owner: not safe for concurrent use.
class StreamSanitizer {
 public:
  explicit StreamSanitizer(std::shared_ptr<const GuardrailEngine> engine,
                           StreamSanitizerOptions options = {});

  std::vector<std::string> Process(const std::string& delta);
  // Terminal call on natural end of stream: one last scan, then release
  // everything that remains.
  std::vector<std::string> Flush();
  // Client went away: drop pending text without releasing it.
  void Cancel();

  bool Blocked() const { return blocked_; }
  // True once any released fragment had a detector rewrite it.
  bool Redacted() const { return redacted_; }
  bool Finished() const { return finished_; }
  std::size_t PendingSize() const { return pending_.size(); }
  std::size_t TailBytes() const { return tail_; }
  const std::string& BlockReason() const { return block_reason_; }

 private:
  // Returns the cut offset into pending_, or 0 when there is no safe cut.
  // On success *prefix holds the verdict for pending_[0, cut).
  std::size_t FindSafeCut(const std::string& whole_sanitized,
                          GuardrailVerdict* prefix) const;
  void Release(std::size_t cut, GuardrailVerdict prefix,
               std::vector<std::string>* out);
  void Block(const GuardrailVerdict& verdict, std::vector<std::string>* out);

  std::shared_ptr<const GuardrailEngine> engine_;
  StreamSanitizerOptions options_;
  std::size_t tail_;
  std::string pending_;
  bool blocked_{false};
  bool redacted_{false};
  bool finished_{false};
  std::string block_reason_;
};

// Pull interface over upstream text deltas.
class DeltaSource {
 public:
  virtual ~DeltaSource() = default;
  // Returns false at end of stream. Throws on transport failure.
  virtual bool Next(std::string* delta) = 0;
  virtual void Close() = 0;
};

// Pull-based sanitized stream: Next() yields safe fragments until the source
// is exhausted and flushed. Close() is cancellation and never runs the flush
// release path.
class SanitizedStream {
 public:
  SanitizedStream(std::unique_ptr<DeltaSource> source,
                  std::shared_ptr<const GuardrailEngine> engine,
                  StreamSanitizerOptions options = {});
  ~SanitizedStream();
  SanitizedStream(const SanitizedStream&) = delete;
  SanitizedStream& operator=(const SanitizedStream&) = delete;

  bool Next(std::string* fragment);
  void Close();

  const StreamSanitizer& sanitizer() const { return sanitizer_; }

 private:
  void Enqueue(std::vector<std::string> fragments);

  std::unique_ptr<DeltaSource> source_;
  StreamSanitizer sanitizer_;
  std::deque<std::string> ready_;
  bool closed_{false};
};

}  // namespace sentinel
