#pragma once

#include "audit/audit_logger.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace sentinel {

// AuditQueue decouples audit writes from the response path. Record() never
// blocks: when `capacity` records are already waiting, the oldest one is
// dropped and counted. A single worker thread drains into the wrapped sink.
class AuditQueue : public AuditSink {
 public:
  explicit AuditQueue(std::shared_ptr<AuditSink> sink,
                      std::size_t capacity = 1024);
  ~AuditQueue() override;

  void Record(const AuditRecord& record) override;

  // Writes everything still queued, then joins the worker. Records arriving
  // after Stop() are dropped.
  void Stop();

  uint64_t Dropped() const { return dropped_.load(); }
  uint64_t Written() const { return written_.load(); }
  std::size_t Pending() const;

 private:
  void Worker();

  std::shared_ptr<AuditSink> sink_;
  std::size_t capacity_;
  std::deque<AuditRecord> queue_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_{false};
  std::thread worker_;
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> written_{0};
};

}  // namespace sentinel
