#pragma once

#include "gateway/adapters/provider_adapter.h"

namespace sentinel {

// Anthropic Messages API (/v1/messages).
class AnthropicAdapter : public ProviderAdapter {
 public:
  // The Messages API requires max_tokens.
  static constexpr int kDefaultMaxTokens = 1024;

  WireFormat Format() const override { return WireFormat::kAnthropic; }
  json ToUpstream(const CanonicalRequest& request) const override;
  bool FromUpstream(const json& body, CanonicalResponse* response,
                    std::string* error) const override;
  bool ParseStreamEvent(const std::string& data,
                        StreamDelta* delta) const override;

  static std::string MapStopReason(const std::string& stop_reason);
};

}  // namespace sentinel
