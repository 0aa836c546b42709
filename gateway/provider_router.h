#pragma once

#include <map>
#include <string>

namespace sentinel {

enum class WireFormat { kOpenAI, kAnthropic, kGemini };

const char* WireFormatName(WireFormat format);

struct RouteTarget {
  std::string provider;  // openai | anthropic | gemini | xai | fallback
  WireFormat wire_format{WireFormat::kOpenAI};
  std::string endpoint_url;
  // Same as endpoint_url for providers that stream from one URL.
  std::string stream_endpoint_url;
  std::map<std::string, std::string> headers;
};

struct ProviderCredentials {
  std::string openai_api_key;
  std::string anthropic_api_key;
  std::string gemini_api_key;
  std::string xai_api_key;
  std::string fallback_api_key;
};

struct RouterConfig {
  ProviderCredentials credentials;
  // OpenAI-compatible endpoint for models no table entry claims.
  std::string fallback_endpoint{"http://localhost:11434/v1/chat/completions"};
  std::string openai_endpoint{"https://api.openai.com/v1/chat/completions"};
  std::string anthropic_endpoint{"https://api.anthropic.com/v1/messages"};
  // {model} is replaced with the requested model name.
  std::string gemini_base{
      "https://generativelanguage.googleapis.com/v1beta/models/{model}"};
  std::string xai_endpoint{"https://api.x.ai/v1/chat/completions"};
  std::string anthropic_version{"2023-06-01"};
};

// Maps a requested model name to its upstream. Pure: no I/O, never fails,
// unknown names go to the fallback endpoint.
class ProviderRouter {
 public:
  explicit ProviderRouter(RouterConfig config);

  RouteTarget Resolve(const std::string& model) const;

  const RouterConfig& config() const { return config_; }

 private:
  RouteTarget OpenAICompatible(const std::string& provider,
                               const std::string& endpoint,
                               const std::string& api_key) const;

  RouterConfig config_;
};

}  // namespace sentinel
