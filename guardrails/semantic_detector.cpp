#include "guardrails/semantic_detector.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace sentinel {

std::unique_ptr<SemanticDetector> SemanticDetector::Create(
    const DetectorConfig& config,
    std::shared_ptr<const EmbeddingBackend> backend,
    const std::string& profile_name) {
  if (config.phrases.empty()) {
    log::Warn("detector", "[" + profile_name +
                              "] semantic_blocking enabled without "
                              "forbidden_intents; skipping");
    return nullptr;
  }
  if (!backend) {
    log::Warn("detector", "[" + profile_name +
                              "] semantic_blocking enabled but no embedding "
                              "backend is configured; skipping");
    return nullptr;
  }
  std::vector<Embedding> intents;
  try {
    intents = backend->Embed(config.phrases);
  } catch (const std::exception& ex) {
    log::Error("detector", "[" + profile_name +
                               "] failed to embed forbidden intents; "
                               "semantic_blocking disabled",
               std::string("error=") + ex.what());
    return nullptr;
  }
  if (intents.size() != config.phrases.size()) {
    log::Error("detector", "[" + profile_name +
                               "] embedding backend returned " +
                               std::to_string(intents.size()) + " vectors for " +
                               std::to_string(config.phrases.size()) +
                               " intents; semantic_blocking disabled");
    return nullptr;
  }
  log::Info("detector", "[" + profile_name + "] semantic: encoded " +
                            std::to_string(intents.size()) + " intents",
            "threshold=" + std::to_string(config.threshold));
  return std::unique_ptr<SemanticDetector>(new SemanticDetector(
      std::move(backend), std::move(intents), config.threshold, config.mode));
}

SemanticDetector::SemanticDetector(
    std::shared_ptr<const EmbeddingBackend> backend,
    std::vector<Embedding> intents, double threshold, DetectorMode mode)
    : backend_(std::move(backend)),
      intents_(std::move(intents)),
      threshold_(threshold),
      mode_(mode) {}

DetectorFinding SemanticDetector::Inspect(std::string* text) const {
  DetectorFinding finding;
  if (text->empty()) {
    return finding;
  }
  std::vector<Embedding> embedded;
  try {
    embedded = backend_->Embed({*text});
  } catch (const std::exception& ex) {
    if (!failure_logged_.exchange(true)) {
      log::Warn("detector", "semantic backend failed; check skipped",
                std::string("error=") + ex.what());
    } else {
      log::Debug("detector", "semantic backend failed; check skipped",
                 std::string("error=") + ex.what());
    }
    return finding;
  }
  if (embedded.empty()) {
    return finding;
  }
  double best = 0.0;
  for (const auto& intent : intents_) {
    best = std::max(best, CosineSimilarity(embedded.front(), intent));
  }
  finding.score = best;
  if (best > threshold_) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Semantic:Intent violation (%.2f)", best);
    finding.fired = true;
    finding.description = buf;
    finding.labels.push_back("intent");
  }
  return finding;
}

}  // namespace sentinel
