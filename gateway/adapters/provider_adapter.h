#pragma once

#include "gateway/canonical.h"
#include "gateway/provider_router.h"

#include <string>

namespace sentinel {

// ProviderAdapter translates between the canonical shape and one upstream
// wire-format family. Adapters are stateless and shared across threads.
class ProviderAdapter {
 public:
  virtual ~ProviderAdapter() = default;

  virtual WireFormat Format() const = 0;

  virtual json ToUpstream(const CanonicalRequest& request) const = 0;

  // Returns false and fills *error when `body` is not a usable response.
  virtual bool FromUpstream(const json& body, CanonicalResponse* response,
                            std::string* error) const = 0;

  // Normalizes any family's error body (JSON object, plain text, safety
  // block) into {message, code}.
  virtual CanonicalError FromUpstreamError(const std::string& body,
                                           int status) const;

  // Decodes the payload of one SSE "data:" line. Returns false for events
  // that carry no content or terminal signal (pings, metadata). Throws
  // std::runtime_error for an in-stream error event.
  virtual bool ParseStreamEvent(const std::string& data,
                                StreamDelta* delta) const = 0;
};

// Shared stateless instance per family.
const ProviderAdapter& AdapterFor(WireFormat format);

// Error normalization used by every family.
CanonicalError NormalizeUpstreamError(const std::string& body, int status);

}  // namespace sentinel
