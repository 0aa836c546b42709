#include "gateway/provider_router.h"

#include <algorithm>
#include <cctype>

namespace sentinel {

namespace {

struct PrefixRule {
  const char* prefix;
  const char* provider;
};

// First match wins.
constexpr PrefixRule kPrefixTable[] = {
    {"gpt-", "openai"},      {"chatgpt-", "openai"}, {"o1", "openai"},
    {"o3", "openai"},        {"o4", "openai"},       {"text-", "openai"},
    {"claude-", "anthropic"}, {"gemini-", "gemini"}, {"grok-", "xai"},
};

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool StartsWith(const std::string& value, const char* prefix) {
  return value.rfind(prefix, 0) == 0;
}

// The model name becomes one URL path segment: everything outside the
// unreserved set is percent-encoded so '/', '?' or '#' cannot reshape the
// upstream URL.
std::string EncodePathSegment(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string ReplaceModel(std::string pattern, const std::string& model) {
  const std::string token = "{model}";
  auto pos = pattern.find(token);
  if (pos != std::string::npos) {
    pattern.replace(pos, token.size(), model);
  }
  return pattern;
}

}  // namespace

const char* WireFormatName(WireFormat format) {
  switch (format) {
    case WireFormat::kOpenAI:
      return "openai";
    case WireFormat::kAnthropic:
      return "anthropic";
    case WireFormat::kGemini:
      return "gemini";
  }
  return "unknown";
}

ProviderRouter::ProviderRouter(RouterConfig config)
    : config_(std::move(config)) {}

RouteTarget ProviderRouter::OpenAICompatible(
    const std::string& provider, const std::string& endpoint,
    const std::string& api_key) const {
  RouteTarget target;
  target.provider = provider;
  target.wire_format = WireFormat::kOpenAI;
  target.endpoint_url = endpoint;
  target.stream_endpoint_url = endpoint;
  if (!api_key.empty()) {
    target.headers["Authorization"] = "Bearer " + api_key;
  }
  return target;
}

RouteTarget ProviderRouter::Resolve(const std::string& model) const {
  const std::string name = Lower(model);
  std::string provider = "fallback";
  for (const auto& rule : kPrefixTable) {
    if (StartsWith(name, rule.prefix)) {
      provider = rule.provider;
      break;
    }
  }
  const auto& creds = config_.credentials;
  if (provider == "openai") {
    return OpenAICompatible(provider, config_.openai_endpoint,
                            creds.openai_api_key);
  }
  if (provider == "xai") {
    return OpenAICompatible(provider, config_.xai_endpoint,
                            creds.xai_api_key);
  }
  if (provider == "anthropic") {
    RouteTarget target;
    target.provider = provider;
    target.wire_format = WireFormat::kAnthropic;
    target.endpoint_url = config_.anthropic_endpoint;
    target.stream_endpoint_url = config_.anthropic_endpoint;
    target.headers["anthropic-version"] = config_.anthropic_version;
    if (!creds.anthropic_api_key.empty()) {
      target.headers["x-api-key"] = creds.anthropic_api_key;
    }
    return target;
  }
  if (provider == "gemini") {
    RouteTarget target;
    target.provider = provider;
    target.wire_format = WireFormat::kGemini;
    auto base = ReplaceModel(config_.gemini_base, EncodePathSegment(model));
    target.endpoint_url = base + ":generateContent";
    target.stream_endpoint_url = base + ":streamGenerateContent?alt=sse";
    if (!creds.gemini_api_key.empty()) {
      target.headers["x-goog-api-key"] = creds.gemini_api_key;
    }
    return target;
  }
  return OpenAICompatible("fallback", config_.fallback_endpoint,
                          creds.fallback_api_key);
}

}  // namespace sentinel
