#include "audit/audit_logger.h"

#include "server/logging/logger.h"

#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace sentinel {

JsonlAuditSink::JsonlAuditSink(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
    if (!stream_.is_open()) {
      log::Error("audit", "cannot open audit log; auditing disabled",
                 "path=" + path);
    }
  }
}

std::string JsonlAuditSink::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(),
         hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string JsonlAuditSink::Format(const AuditRecord& record) const {
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();
  json j;
  j["timestamp_ms"] = ts;
  j["client_id"] = record.client_id;
  j["verdict"] = record.verdict;
  j["latency_ms"] = record.latency_ms;
  if (debug_mode_) {
    j["original_text"] = record.original_text;
  } else {
    j["original_sha256"] = HashContent(record.original_text);
  }
  j["sanitized_text"] = record.sanitized_text;
  j["metadata"] = record.metadata;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void JsonlAuditSink::Record(const AuditRecord& record) {
  if (!Enabled()) {
    return;
  }
  auto line = Format(record);
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace sentinel
