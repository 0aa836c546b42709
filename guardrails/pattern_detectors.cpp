#include "guardrails/pattern_detectors.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace sentinel {

namespace {

constexpr auto kSyntax = std::regex::ECMAScript | std::regex::optimize;

// Every repetition is bounded. libstdc++'s regex executor recurses once per
// repeated character, so an unbounded `+` over a long unbroken run overflows
// the stack. The bounds double as the stream sanitizer's tail length.
constexpr std::size_t kEmailMaxLength = 254;
constexpr std::size_t kOpenEndedTokenMax = 256;
// Whitespace allowed between the words of an injection phrase.
constexpr std::size_t kMaxWordGap = 8;

NamedPattern PiiPattern(const std::string& name) {
  if (name == "EMAIL") {
    return {name,
            std::regex(R"([a-zA-Z0-9._%+-]{1,64}@)"
                       R"([a-zA-Z0-9.-]{1,125}\.[a-zA-Z]{2,63})",
                       kSyntax),
            kEmailMaxLength};
  }
  if (name == "SSN") {
    return {name, std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", kSyntax), 11};
  }
  if (name == "CREDIT_CARD") {
    return {name, std::regex(R"(\b(?:\d{4}[- ]?){3}\d{4}\b)", kSyntax), 19};
  }
  if (name == "PHONE") {
    return {name, std::regex(R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)", kSyntax), 12};
  }
  if (name == "IP_ADDRESS") {
    return {name,
            std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3})"
                       R"((?:25[0-5]|2[0-4]\d|1?\d?\d)\b)",
                       kSyntax),
            15};
  }
  throw std::invalid_argument("unknown PII pattern: " + name);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string Join(const std::vector<std::string>& parts, const char* sep) {
  std::ostringstream out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) {
      out << sep;
    }
    out << parts[i];
  }
  return out.str();
}

std::size_t MaxOf(const std::vector<NamedPattern>& patterns) {
  std::size_t longest = 0;
  for (const auto& p : patterns) {
    longest = std::max(longest, p.max_length);
  }
  return longest;
}

}  // namespace

std::string EscapeRegex(const std::string& literal) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(literal.size() * 2);
  for (char c : literal) {
    if (kSpecial.find(c) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

PiiDetector::PiiDetector(const std::vector<std::string>& pattern_names,
                         DetectorMode mode)
    : mode_(mode) {
  for (const auto& name : KnownPiiPatterns()) {
    if (std::find(pattern_names.begin(), pattern_names.end(), name) !=
        pattern_names.end()) {
      patterns_.push_back(PiiPattern(name));
    }
  }
}

std::string PiiDetector::Placeholder(const std::string& pattern_name) {
  return "<" + pattern_name + "_REDACTED>";
}

std::size_t PiiDetector::MaxMatchLength() const { return MaxOf(patterns_); }

DetectorFinding PiiDetector::Inspect(std::string* text) const {
  DetectorFinding finding;
  std::vector<std::string> rules;
  for (const auto& pattern : patterns_) {
    if (!std::regex_search(*text, pattern.regex)) {
      continue;
    }
    *text = std::regex_replace(*text, pattern.regex,
                               Placeholder(pattern.name));
    finding.labels.push_back(pattern.name);
    rules.push_back("PII:" + pattern.name);
  }
  finding.fired = !rules.empty();
  finding.description = Join(rules, ", ");
  return finding;
}

TopicDetector::TopicDetector(const std::vector<std::string>& phrases,
                             DetectorMode mode)
    : mode_(mode) {
  for (const auto& phrase : phrases) {
    if (!phrase.empty()) {
      phrases_.push_back(phrase);
      max_length_ = std::max(max_length_, phrase.size());
    }
  }
  if (phrases_.empty()) {
    return;
  }
  // Longest first so overlapping phrases report the most specific match.
  auto ordered = phrases_;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const std::string& a, const std::string& b) {
                     return a.size() > b.size();
                   });
  std::string pattern = R"(\b(?:)";
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (i) {
      pattern += "|";
    }
    pattern += EscapeRegex(ordered[i]);
  }
  pattern += R"()\b)";
  regex_ = std::regex(pattern, kSyntax | std::regex::icase);
}

DetectorFinding TopicDetector::Inspect(std::string* text) const {
  DetectorFinding finding;
  if (phrases_.empty()) {
    return finding;
  }
  std::set<std::string> matched;
  for (auto it = std::sregex_iterator(text->begin(), text->end(), regex_);
       it != std::sregex_iterator(); ++it) {
    matched.insert(ToLower(it->str()));
  }
  if (matched.empty()) {
    return finding;
  }
  finding.fired = true;
  finding.labels.assign(matched.begin(), matched.end());
  finding.description = "Topic:" + Join(finding.labels, ",");
  if (mode_ == DetectorMode::kRedact) {
    *text = std::regex_replace(*text, regex_, "<TOPIC_REDACTED>");
  }
  return finding;
}

SecretDetector::SecretDetector(DetectorMode mode) : mode_(mode) {
  patterns_.push_back(
      {"AWS_ACCESS_KEY", std::regex(R"(\bAKIA[0-9A-Z]{16}\b)", kSyntax), 20});
  patterns_.push_back({"OPENAI_KEY",
                       std::regex(R"(\bsk-[A-Za-z0-9_-]{20,253})", kSyntax),
                       kOpenEndedTokenMax});
  patterns_.push_back({"GITHUB_TOKEN",
                       std::regex(R"(\bgh[pousr]_[A-Za-z0-9]{36}\b)", kSyntax),
                       40});
  patterns_.push_back(
      {"SLACK_TOKEN",
       std::regex(R"(\bxox[baprs]-[A-Za-z0-9-]{10,251})", kSyntax),
       kOpenEndedTokenMax});
  patterns_.push_back(
      {"PRIVATE_KEY",
       std::regex(R"(-----BEGIN [A-Z ]{0,24}PRIVATE KEY-----)", kSyntax), 64});
  patterns_.push_back(
      {"GENERIC_CREDENTIAL",
       std::regex(R"(\b(?:api[_-]?key|secret|token|password)\s{0,8}[:=]\s{0,8})"
                  R"(["']?[A-Za-z0-9_\-/+=.]{8,220})",
                  kSyntax | std::regex::icase),
       kOpenEndedTokenMax});
}

std::size_t SecretDetector::MaxMatchLength() const { return MaxOf(patterns_); }

DetectorFinding SecretDetector::Inspect(std::string* text) const {
  DetectorFinding finding;
  for (const auto& pattern : patterns_) {
    if (!std::regex_search(*text, pattern.regex)) {
      continue;
    }
    finding.labels.push_back(pattern.name);
    if (mode_ == DetectorMode::kRedact) {
      *text = std::regex_replace(*text, pattern.regex,
                                 "<" + pattern.name + "_REDACTED>");
    }
  }
  if (!finding.labels.empty()) {
    finding.fired = true;
    finding.description = "Secret:" + Join(finding.labels, ",");
  }
  return finding;
}

const std::vector<std::string>& InjectionDetector::DefaultKeywords() {
  static const std::vector<std::string> kKeywords = {
      "ignore previous instructions",
      "ignore all previous instructions",
      "ignore the above",
      "disregard previous",
      "disregard all prior",
      "forget your instructions",
      "system prompt",
      "developer mode",
      "jailbreak",
      "you are now",
      "act as dan",
      "do anything now",
      "reveal your instructions",
  };
  return kKeywords;
}

InjectionDetector::InjectionDetector(const std::vector<std::string>& keywords,
                                     DetectorMode mode)
    : mode_(mode) {
  const auto& source = keywords.empty() ? DefaultKeywords() : keywords;
  for (const auto& keyword : source) {
    std::istringstream words(keyword);
    std::vector<std::string> parts;
    std::string word;
    while (words >> word) {
      parts.push_back(EscapeRegex(word));
    }
    if (parts.empty()) {
      continue;
    }
    std::string gap = R"(\s{1,)" + std::to_string(kMaxWordGap) + "}";
    std::string pattern = R"(\b)" + Join(parts, gap.c_str()) + R"(\b)";
    keywords_.emplace_back(ToLower(keyword),
                           std::regex(pattern, kSyntax | std::regex::icase));
    max_length_ =
        std::max(max_length_, keyword.size() + kMaxWordGap * parts.size());
  }
}

DetectorFinding InjectionDetector::Inspect(std::string* text) const {
  DetectorFinding finding;
  for (const auto& entry : keywords_) {
    if (!std::regex_search(*text, entry.second)) {
      continue;
    }
    finding.labels.push_back(entry.first);
    if (mode_ == DetectorMode::kRedact) {
      *text = std::regex_replace(*text, entry.second, "<INJECTION_REDACTED>");
    }
  }
  if (!finding.labels.empty()) {
    finding.fired = true;
    finding.description = "Injection:" + Join(finding.labels, ",");
  }
  return finding;
}

}  // namespace sentinel
