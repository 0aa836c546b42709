#include "audit/audit_queue.h"

#include "server/logging/logger.h"

#include <stdexcept>

namespace sentinel {

AuditQueue::AuditQueue(std::shared_ptr<AuditSink> sink, std::size_t capacity)
    : sink_(std::move(sink)), capacity_(capacity == 0 ? 1 : capacity) {
  worker_ = std::thread(&AuditQueue::Worker, this);
}

AuditQueue::~AuditQueue() { Stop(); }

void AuditQueue::Record(const AuditRecord& record) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      dropped_.fetch_add(1);
      return;
    }
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      auto dropped = dropped_.fetch_add(1) + 1;
      // Logged on the 1st, 2nd, 4th, 8th, ... drop.
      if ((dropped & (dropped - 1)) == 0) {
        log::Warn("audit", "audit queue full; dropped oldest record",
                  "dropped_total=" + std::to_string(dropped));
      }
    }
    queue_.push_back(record);
  }
  cv_.notify_one();
}

void AuditQueue::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_ && !worker_.joinable()) {
      return;
    }
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::size_t AuditQueue::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void AuditQueue::Worker() {
  while (true) {
    AuditRecord record;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&] { return stop_ || !queue_.empty(); });
      if (stop_ && queue_.empty()) {
        return;
      }
      record = std::move(queue_.front());
      queue_.pop_front();
    }
    if (!sink_) {
      continue;
    }
    try {
      sink_->Record(record);
      written_.fetch_add(1);
    } catch (const std::exception& ex) {
      log::Error("audit", "audit sink failed", std::string("error=") + ex.what());
    }
  }
}

}  // namespace sentinel
