#pragma once

#include "guardrails/detector.h"
#include "guardrails/embedding_backend.h"
#include "policy/profile.h"

#include <memory>
#include <string>
#include <vector>

namespace sentinel {

enum class GuardrailAction { kAllowed, kRedacted, kBlocked };

const char* ActionName(GuardrailAction action);

struct GuardrailVerdict {
  bool valid{true};
  std::string sanitized_text;
  std::string reason;  // Fired rule strings joined with ", ".
  GuardrailAction action{GuardrailAction::kAllowed};
  double score{0.0};   // Highest semantic similarity seen, 0 if not run.
  std::vector<std::string> triggered;
};

// GuardrailEngine is an immutable detector stack built from one Profile.
// Published engines are shared between request threads; nothing in them is
// mutated after Build() returns.
class GuardrailEngine {
 public:
  // Detectors that fail to initialize are skipped with a log line; Build
  // itself does not fail. `embedder` may be null, which disables the
  // semantic detector.
  static std::shared_ptr<const GuardrailEngine> Build(
      const Profile& profile,
      std::shared_ptr<const EmbeddingBackend> embedder = nullptr);

  GuardrailVerdict Validate(const std::string& text) const;
  // Same detector stack, applied to completions.
  GuardrailVerdict ValidateOutput(const std::string& text) const;

  const std::string& ProfileName() const { return profile_name_; }
  const std::string& Description() const { return description_; }
  std::vector<std::string> DetectorNames() const;
  std::size_t MaxMatchLength() const { return max_match_length_; }

 private:
  GuardrailEngine() = default;
  GuardrailVerdict Scan(const std::string& text) const;

  std::string profile_name_;
  std::string description_;
  std::vector<std::unique_ptr<Detector>> detectors_;
  std::size_t max_match_length_{0};
};

}  // namespace sentinel
