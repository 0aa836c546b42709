#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace sentinel {

// One gateway decision. `verdict` is a label such as PASSED, REDACTED,
// "BLOCKED: <reason>", "OUTPUT_BLOCKED: <reason>", FAILED_UPSTREAM_<status>
// or RATE_LIMITED.
struct AuditRecord {
  std::string client_id;
  std::string original_text;
  std::string sanitized_text;
  std::string verdict;
  double latency_ms{0.0};
  nlohmann::json metadata = nlohmann::json::object();
};

class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void Record(const AuditRecord& record) = 0;
};

// Appends one JSON object per line. In production mode (debug_mode=false)
// the original text is stored only as a SHA-256 hex digest.
class JsonlAuditSink : public AuditSink {
 public:
  explicit JsonlAuditSink(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }
  void Record(const AuditRecord& record) override;

  // Serialized form of one record, without the trailing newline.
  std::string Format(const AuditRecord& record) const;

  static std::string HashContent(const std::string& content);

 private:
  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace sentinel
