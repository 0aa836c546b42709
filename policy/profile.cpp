#include "policy/profile.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sentinel {

namespace {

bool ReadStringList(const YAML::Node &node, const std::string &field,
                    std::vector<std::string> *out, std::string *error) {
  if (!node) {
    return true;
  }
  if (!node.IsSequence()) {
    *error = field + " must be a list of strings";
    return false;
  }
  for (const auto &item : node) {
    if (!item.IsScalar()) {
      *error = field + " entries must be strings";
      return false;
    }
    auto value = item.as<std::string>();
    if (!value.empty()) {
      out->push_back(value);
    }
  }
  return true;
}

bool ParseMode(const YAML::Node &node, DetectorKind kind, DetectorMode *mode,
               std::string *error) {
  *mode = DefaultMode(kind);
  if (!node["mode"]) {
    return true;
  }
  auto value = node["mode"].as<std::string>();
  if (value == "redact") {
    *mode = DetectorMode::kRedact;
  } else if (value == "block") {
    *mode = DetectorMode::kBlock;
  } else {
    *error = std::string(DetectorKindName(kind)) + ": unknown mode '" +
             value + "'";
    return false;
  }
  return true;
}

bool ParseDetector(const std::string &key, const YAML::Node &node,
                   DetectorConfig *cfg, std::string *error) {
  if (key == "pii") {
    cfg->kind = DetectorKind::kPII;
  } else if (key == "topics") {
    cfg->kind = DetectorKind::kTopic;
  } else if (key == "secrets") {
    cfg->kind = DetectorKind::kSecret;
  } else if (key == "injection") {
    cfg->kind = DetectorKind::kInjection;
  } else if (key == "semantic_blocking" || key == "semantic") {
    cfg->kind = DetectorKind::kSemantic;
  } else {
    *error = "unknown detector '" + key + "'";
    return false;
  }
  if (!node.IsMap()) {
    *error = key + ": detector config must be a mapping";
    return false;
  }
  cfg->enabled = node["enabled"] ? node["enabled"].as<bool>() : false;
  if (!ParseMode(node, cfg->kind, &cfg->mode, error)) {
    return false;
  }

  switch (cfg->kind) {
  case DetectorKind::kPII: {
    if (!ReadStringList(node["patterns"], "pii.patterns", &cfg->patterns,
                        error)) {
      return false;
    }
    const auto &known = KnownPiiPatterns();
    for (const auto &name : cfg->patterns) {
      if (std::find(known.begin(), known.end(), name) == known.end()) {
        *error = "pii: unknown pattern '" + name + "'";
        return false;
      }
    }
    break;
  }
  case DetectorKind::kTopic:
    if (!ReadStringList(node["block_list"], "topics.block_list",
                        &cfg->phrases, error)) {
      return false;
    }
    break;
  case DetectorKind::kInjection:
    if (!ReadStringList(node["keywords"], "injection.keywords", &cfg->phrases,
                        error)) {
      return false;
    }
    break;
  case DetectorKind::kSecret:
    break;
  case DetectorKind::kSemantic:
    if (!ReadStringList(node["forbidden_intents"],
                        "semantic_blocking.forbidden_intents", &cfg->phrases,
                        error)) {
      return false;
    }
    if (node["threshold"]) {
      cfg->threshold = node["threshold"].as<double>();
    }
    if (cfg->mode == DetectorMode::kRedact) {
      *error = "semantic_blocking: redact mode is not supported";
      return false;
    }
    if (!(cfg->threshold >= 0.0 && cfg->threshold <= 1.0)) {
      *error = "semantic_blocking: threshold must be within [0, 1]";
      return false;
    }
    break;
  }
  return true;
}

}  // namespace

const char *DetectorKindName(DetectorKind kind) {
  switch (kind) {
  case DetectorKind::kPII:
    return "pii";
  case DetectorKind::kTopic:
    return "topics";
  case DetectorKind::kSecret:
    return "secrets";
  case DetectorKind::kInjection:
    return "injection";
  case DetectorKind::kSemantic:
    return "semantic_blocking";
  }
  return "unknown";
}

const char *DetectorModeName(DetectorMode mode) {
  return mode == DetectorMode::kRedact ? "redact" : "block";
}

DetectorMode DefaultMode(DetectorKind kind) {
  return kind == DetectorKind::kPII ? DetectorMode::kRedact
                                    : DetectorMode::kBlock;
}

const DetectorConfig *Profile::Find(DetectorKind kind) const {
  auto it = detectors.find(kind);
  if (it == detectors.end() || !it->second.enabled) {
    return nullptr;
  }
  return &it->second;
}

const std::vector<std::string> &KnownPiiPatterns() {
  static const std::vector<std::string> kPatterns = {
      "EMAIL", "SSN", "CREDIT_CARD", "PHONE", "IP_ADDRESS"};
  return kPatterns;
}

bool ParseProfile(const YAML::Node &root, Profile *profile,
                  std::string *error) {
  std::string local_error;
  if (!error) {
    error = &local_error;
  }
  try {
    if (!root || !root.IsMap()) {
      *error = "profile must be a YAML mapping";
      return false;
    }
    Profile parsed;
    if (!root["profile_name"] || !root["profile_name"].IsScalar()) {
      *error = "profile_name is required";
      return false;
    }
    parsed.name = root["profile_name"].as<std::string>();
    if (root["description"]) {
      parsed.description = root["description"].as<std::string>();
    }
    const auto detectors = root["detectors"];
    if (detectors) {
      if (!detectors.IsMap()) {
        *error = "detectors must be a mapping of kind to config";
        return false;
      }
      for (const auto &entry : detectors) {
        DetectorConfig cfg;
        if (!ParseDetector(entry.first.as<std::string>(), entry.second, &cfg,
                           error)) {
          return false;
        }
        parsed.detectors[cfg.kind] = std::move(cfg);
      }
    }
    *profile = std::move(parsed);
    return true;
  } catch (const YAML::Exception &ex) {
    *error = std::string("profile schema error: ") + ex.what();
    return false;
  }
}

bool ParseProfileYaml(const std::string &text, Profile *profile,
                      std::string *error) {
  try {
    return ParseProfile(YAML::Load(text), profile, error);
  } catch (const YAML::Exception &ex) {
    if (error) {
      *error = std::string("profile parse error: ") + ex.what();
    }
    return false;
  }
}

bool LoadProfileFile(const std::string &path, Profile *profile,
                     std::string *error) {
  std::ifstream input(path);
  if (!input.good()) {
    if (error) {
      *error = "profile file unreadable: " + path;
    }
    return false;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return ParseProfileYaml(buffer.str(), profile, error);
}

Profile SafetyFloorProfile() {
  Profile profile;
  profile.name = "FALLBACK";
  profile.description = "Safety floor: prompt-injection detection only";
  DetectorConfig injection;
  injection.kind = DetectorKind::kInjection;
  injection.enabled = true;
  injection.mode = DetectorMode::kBlock;
  profile.detectors[DetectorKind::kInjection] = injection;
  return profile;
}

}  // namespace sentinel
