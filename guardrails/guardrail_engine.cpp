#include "guardrails/guardrail_engine.h"

#include "guardrails/pattern_detectors.h"
#include "guardrails/semantic_detector.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace sentinel {

namespace {

constexpr DetectorKind kScanOrder[] = {
    DetectorKind::kPII, DetectorKind::kTopic, DetectorKind::kSecret,
    DetectorKind::kInjection, DetectorKind::kSemantic};

std::unique_ptr<Detector> MakeDetector(
    const DetectorConfig& config,
    const std::shared_ptr<const EmbeddingBackend>& embedder,
    const std::string& profile_name) {
  switch (config.kind) {
    case DetectorKind::kPII:
      return std::make_unique<PiiDetector>(config.patterns, config.mode);
    case DetectorKind::kTopic:
      if (config.phrases.empty()) {
        log::Warn("engine", "[" + profile_name +
                                "] topics enabled with an empty block_list");
        return nullptr;
      }
      return std::make_unique<TopicDetector>(config.phrases, config.mode);
    case DetectorKind::kSecret:
      return std::make_unique<SecretDetector>(config.mode);
    case DetectorKind::kInjection:
      return std::make_unique<InjectionDetector>(config.phrases, config.mode);
    case DetectorKind::kSemantic:
      return SemanticDetector::Create(config, embedder, profile_name);
  }
  return nullptr;
}

}  // namespace

const char* ActionName(GuardrailAction action) {
  switch (action) {
    case GuardrailAction::kAllowed:
      return "allowed";
    case GuardrailAction::kRedacted:
      return "redacted";
    case GuardrailAction::kBlocked:
      return "blocked";
  }
  return "unknown";
}

std::shared_ptr<const GuardrailEngine> GuardrailEngine::Build(
    const Profile& profile, std::shared_ptr<const EmbeddingBackend> embedder) {
  std::shared_ptr<GuardrailEngine> engine(new GuardrailEngine());
  engine->profile_name_ = profile.name;
  engine->description_ = profile.description;
  for (DetectorKind kind : kScanOrder) {
    const DetectorConfig* config = profile.Find(kind);
    if (!config) {
      continue;
    }
    std::unique_ptr<Detector> detector;
    try {
      detector = MakeDetector(*config, embedder, profile.name);
    } catch (const std::exception& ex) {
      // std::regex_error and unknown pattern names land here.
      log::Error("engine", "[" + profile.name + "] " +
                               DetectorKindName(kind) +
                               " failed to initialize; disabled",
                 std::string("error=") + ex.what());
      continue;
    }
    if (!detector) {
      continue;
    }
    engine->max_match_length_ =
        std::max(engine->max_match_length_, detector->MaxMatchLength());
    log::Info("engine", "[" + profile.name + "] detector ready",
              std::string("kind=") + DetectorKindName(kind) +
                  " mode=" + DetectorModeName(detector->Mode()));
    engine->detectors_.push_back(std::move(detector));
  }
  log::Info("engine", "profile '" + profile.name + "' built",
            "detectors=" + std::to_string(engine->detectors_.size()));
  return engine;
}

GuardrailVerdict GuardrailEngine::Validate(const std::string& text) const {
  return Scan(text);
}

GuardrailVerdict GuardrailEngine::ValidateOutput(
    const std::string& text) const {
  return Scan(text);
}

std::vector<std::string> GuardrailEngine::DetectorNames() const {
  std::vector<std::string> names;
  names.reserve(detectors_.size());
  for (const auto& detector : detectors_) {
    names.push_back(detector->Name());
  }
  return names;
}

GuardrailVerdict GuardrailEngine::Scan(const std::string& text) const {
  GuardrailVerdict verdict;
  verdict.sanitized_text = text;
  bool blocking = false;
  for (const auto& detector : detectors_) {
    DetectorFinding finding = detector->Inspect(&verdict.sanitized_text);
    verdict.score = std::max(verdict.score, finding.score);
    if (!finding.fired) {
      continue;
    }
    verdict.triggered.push_back(finding.description);
    if (detector->Mode() == DetectorMode::kBlock) {
      blocking = true;
    }
  }
  if (verdict.triggered.empty()) {
    return verdict;
  }
  for (std::size_t i = 0; i < verdict.triggered.size(); ++i) {
    if (i) {
      verdict.reason += ", ";
    }
    verdict.reason += verdict.triggered[i];
  }
  if (blocking) {
    verdict.valid = false;
    verdict.action = GuardrailAction::kBlocked;
  } else {
    verdict.action = GuardrailAction::kRedacted;
  }
  return verdict;
}

}  // namespace sentinel
