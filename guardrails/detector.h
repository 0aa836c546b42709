#pragma once

#include "policy/profile.h"

#include <cstddef>
#include <string>
#include <vector>

namespace sentinel {

// Result of running one detector over one text.
struct DetectorFinding {
  bool fired{false};
  std::vector<std::string> labels;  // Pattern names or matched phrases.
  std::string description;          // Rule string, e.g. "Topic:fraud".
  double score{0.0};                // Only the semantic detector sets this.
};

// Detector is the uniform capability every guardrail check implements. The
// engine holds them in fixed kind order and never inspects concrete types.
//
// Inspect() must be safe to call concurrently: detectors are immutable after
// construction apart from failure bookkeeping.
class Detector {
 public:
  virtual ~Detector() = default;

  virtual DetectorKind Kind() const = 0;
  virtual DetectorMode Mode() const = 0;
  virtual std::string Name() const = 0;

  // Upper bound on the number of bytes a single match can span. The stream
  // sanitizer sizes its retained tail from the maximum across detectors.
  virtual std::size_t MaxMatchLength() const = 0;

  // In redact mode a detector replaces its matches in *text with a
  // placeholder; in block mode it only reports.
  virtual DetectorFinding Inspect(std::string* text) const = 0;
};

}  // namespace sentinel
