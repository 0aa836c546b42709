#pragma once

#include <map>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace sentinel {

// Detector kinds in their fixed evaluation order: cheap structural checks
// first, the semantic check last.
enum class DetectorKind { kPII, kTopic, kSecret, kInjection, kSemantic };

// Whether a firing detector blocks the request or only rewrites it.
enum class DetectorMode { kRedact, kBlock };

const char *DetectorKindName(DetectorKind kind);
const char *DetectorModeName(DetectorMode mode);
DetectorMode DefaultMode(DetectorKind kind);

// Tagged detector configuration. Which fields are meaningful depends on
// `kind`:
//   kPII       patterns  (names from KnownPiiPatterns())
//   kTopic     phrases   (block list)
//   kInjection phrases   (keyword override; empty = built-in list)
//   kSecret    (none)
//   kSemantic  phrases   (forbidden intents), threshold in [0,1]
struct DetectorConfig {
  DetectorKind kind{DetectorKind::kInjection};
  bool enabled{false};
  DetectorMode mode{DetectorMode::kBlock};
  std::vector<std::string> patterns;
  std::vector<std::string> phrases;
  double threshold{0.8};
};

// Immutable once loaded; engines are rebuilt from a whole Profile.
struct Profile {
  std::string name;
  std::string description;
  std::map<DetectorKind, DetectorConfig> detectors;

  // Returns the config for `kind` when present and enabled, nullptr otherwise.
  const DetectorConfig *Find(DetectorKind kind) const;
};

const std::vector<std::string> &KnownPiiPatterns();

// Profile schema (YAML):
//   profile_name: finance
//   description: ...
//   detectors:
//     pii:               {enabled, patterns: [EMAIL, ...], mode?}
//     topics:            {enabled, block_list: [...], mode?}
//     secrets:           {enabled, mode?}
//     injection:         {enabled, keywords: [...]?, mode?}
//     semantic_blocking: {enabled, forbidden_intents: [...], threshold, mode?}
// Returns false and fills *error on any schema violation.
bool ParseProfile(const YAML::Node &root, Profile *profile, std::string *error);
bool ParseProfileYaml(const std::string &text, Profile *profile,
                      std::string *error);
bool LoadProfileFile(const std::string &path, Profile *profile,
                     std::string *error);

// Minimal profile used when the configured one cannot be loaded: only the
// injection detector, so the gateway is never left unprotected.
Profile SafetyFloorProfile();

}  // namespace sentinel
