#pragma once

#include "gateway/adapters/provider_adapter.h"

namespace sentinel {

// The canonical shape is the OpenAI shape; translation is the identity.
// Also serves OpenAI-compatible hosts (xAI, self-hosted servers).
class OpenAIAdapter : public ProviderAdapter {
 public:
  WireFormat Format() const override { return WireFormat::kOpenAI; }
  json ToUpstream(const CanonicalRequest& request) const override;
  bool FromUpstream(const json& body, CanonicalResponse* response,
                    std::string* error) const override;
  bool ParseStreamEvent(const std::string& data,
                        StreamDelta* delta) const override;
};

}  // namespace sentinel
