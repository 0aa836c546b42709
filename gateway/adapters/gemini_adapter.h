#pragma once

#include "gateway/adapters/provider_adapter.h"

namespace sentinel {

// Gemini generateContent / streamGenerateContent?alt=sse.
class GeminiAdapter : public ProviderAdapter {
 public:
  WireFormat Format() const override { return WireFormat::kGemini; }
  json ToUpstream(const CanonicalRequest& request) const override;
  bool FromUpstream(const json& body, CanonicalResponse* response,
                    std::string* error) const override;
  bool ParseStreamEvent(const std::string& data,
                        StreamDelta* delta) const override;

  static std::string MapFinishReason(const std::string& finish_reason);
};

}  // namespace sentinel
