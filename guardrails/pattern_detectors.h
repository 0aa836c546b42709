#pragma once

#include "guardrails/detector.h"

#include <regex>
#include <string>
#include <vector>

namespace sentinel {

struct NamedPattern {
  std::string name;
  std::regex regex;
  std::size_t max_length{0};
};

// Replaces each match of the enabled PII patterns with <KIND_REDACTED>.
// Patterns run in the fixed KnownPiiPatterns() order, not config order.
// Matches are rewritten in block mode too, so a blocked verdict never carries
// raw PII.
class PiiDetector : public Detector {
 public:
  PiiDetector(const std::vector<std::string>& pattern_names, DetectorMode mode);

  DetectorKind Kind() const override { return DetectorKind::kPII; }
  DetectorMode Mode() const override { return mode_; }
  std::string Name() const override { return "pii"; }
  std::size_t MaxMatchLength() const override;
  DetectorFinding Inspect(std::string* text) const override;

  static std::string Placeholder(const std::string& pattern_name);

 private:
  std::vector<NamedPattern> patterns_;
  DetectorMode mode_;
};

// Case-insensitive whole-word block list.
class TopicDetector : public Detector {
 public:
  TopicDetector(const std::vector<std::string>& phrases, DetectorMode mode);

  DetectorKind Kind() const override { return DetectorKind::kTopic; }
  DetectorMode Mode() const override { return mode_; }
  std::string Name() const override { return "topics"; }
  std::size_t MaxMatchLength() const override { return max_length_; }
  DetectorFinding Inspect(std::string* text) const override;

  bool Empty() const { return phrases_.empty(); }

 private:
  std::vector<std::string> phrases_;
  std::regex regex_;
  std::size_t max_length_{0};
  DetectorMode mode_;
};

// Credential-shaped strings: cloud keys, tokens, private key headers.
class SecretDetector : public Detector {
 public:
  explicit SecretDetector(DetectorMode mode);

  DetectorKind Kind() const override { return DetectorKind::kSecret; }
  DetectorMode Mode() const override { return mode_; }
  std::string Name() const override { return "secrets"; }
  std::size_t MaxMatchLength() const override;
  DetectorFinding Inspect(std::string* text) const override;

 private:
  std::vector<NamedPattern> patterns_;
  DetectorMode mode_;
};

// Prompt-injection phrases. Whitespace between words is matched loosely so
// "ignore   previous\ninstructions" still fires.
class InjectionDetector : public Detector {
 public:
  // Empty keywords selects DefaultKeywords().
  InjectionDetector(const std::vector<std::string>& keywords,
                    DetectorMode mode);

  DetectorKind Kind() const override { return DetectorKind::kInjection; }
  DetectorMode Mode() const override { return mode_; }
  std::string Name() const override { return "injection"; }
  std::size_t MaxMatchLength() const override { return max_length_; }
  DetectorFinding Inspect(std::string* text) const override;

  static const std::vector<std::string>& DefaultKeywords();

 private:
  std::vector<std::pair<std::string, std::regex>> keywords_;
  std::size_t max_length_{0};
  DetectorMode mode_;
};

// Escapes ECMAScript regex metacharacters.
std::string EscapeRegex(const std::string& literal);

}  // namespace sentinel
