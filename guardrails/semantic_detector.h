#pragma once

#include "guardrails/detector.h"
#include "guardrails/embedding_backend.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sentinel {

// Blocks text whose embedding is closer than `threshold` (strictly greater
// cosine similarity) to any forbidden intent.
class SemanticDetector : public Detector {
 public:
  // Embeds the forbidden intents once. Returns nullptr, after logging, when
  // there is no backend, no intents, or the backend fails.
  static std::unique_ptr<SemanticDetector> Create(
      const DetectorConfig& config,
      std::shared_ptr<const EmbeddingBackend> backend,
      const std::string& profile_name);

  DetectorKind Kind() const override { return DetectorKind::kSemantic; }
  DetectorMode Mode() const override { return mode_; }
  std::string Name() const override { return "semantic_blocking"; }
  std::size_t MaxMatchLength() const override { return 0; }
  DetectorFinding Inspect(std::string* text) const override;

  double Threshold() const { return threshold_; }
  std::size_t IntentCount() const { return intents_.size(); }

 private:
  SemanticDetector(std::shared_ptr<const EmbeddingBackend> backend,
                   std::vector<Embedding> intents, double threshold,
                   DetectorMode mode);

  std::shared_ptr<const EmbeddingBackend> backend_;
  std::vector<Embedding> intents_;
  double threshold_;
  DetectorMode mode_;
  mutable std::atomic<bool> failure_logged_{false};
};

}  // namespace sentinel
