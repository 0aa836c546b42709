#pragma once

#include "guardrails/guardrail_engine.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace sentinel {

// EngineHandle publishes the current GuardrailEngine. Readers take a snapshot
// with Current() and keep it for the whole request; Switch() builds the
// replacement completely before a single atomic store, so a reader never sees
// a partially built engine.
//
// Thread safety: all methods may be called concurrently.
class EngineHandle {
 public:
  explicit EngineHandle(
      std::shared_ptr<const EmbeddingBackend> embedder = nullptr);

  std::shared_ptr<const GuardrailEngine> Current() const;

  // Publish an engine built from `profile`. Returns false and fills *error
  // when the profile cannot produce an engine; the active engine is then
  // left untouched.
  bool Switch(const Profile& profile, std::string* error);
  bool SwitchFromYaml(const std::string& yaml, std::string* error);
  bool SwitchFromFile(const std::string& path, std::string* error);

  // Startup path: load `path`, or publish SafetyFloorProfile() when it fails.
  // Returns false when the safety floor was used.
  bool InitializeFromFile(const std::string& path);

  std::string ActiveProfileName() const;
  uint64_t SwitchCount() const { return switch_count_.load(); }

 private:
  void Publish(std::shared_ptr<const GuardrailEngine> engine);

  std::shared_ptr<const EmbeddingBackend> embedder_;
  std::shared_ptr<const GuardrailEngine> current_;
  std::atomic<uint64_t> switch_count_{0};
};

}  // namespace sentinel
