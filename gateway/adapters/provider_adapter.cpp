#include "gateway/adapters/provider_adapter.h"

#include "gateway/adapters/anthropic_adapter.h"
#include "gateway/adapters/gemini_adapter.h"
#include "gateway/adapters/openai_adapter.h"
#include "server/text/utf8.h"

namespace sentinel {

namespace {

constexpr std::size_t kMaxRawErrorBytes = 256;

std::string ScalarToString(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  return {};
}

bool FromErrorObject(const json& body, CanonicalError* error) {
  if (body.is_array() && !body.empty()) {
    return FromErrorObject(body.front(), error);
  }
  if (!body.is_object()) {
    return false;
  }
  if (body.contains("error")) {
    const auto& err = body["error"];
    if (err.is_string()) {
      error->message = err.get<std::string>();
      return !error->message.empty();
    }
    if (err.is_object()) {
      error->message = err.value("message", std::string());
      // OpenAI: code; Anthropic: type; Gemini: status.
      for (const char* key : {"code", "type", "status"}) {
        if (err.contains(key)) {
          auto value = ScalarToString(err[key]);
          if (!value.empty()) {
            error->code = value;
            break;
          }
        }
      }
      return !error->message.empty();
    }
  }
  if (body.contains("promptFeedback") && body["promptFeedback"].is_object()) {
    auto reason = body["promptFeedback"].value("blockReason", std::string());
    if (!reason.empty()) {
      error->message = "Upstream safety filter blocked the request: " + reason;
      error->code = "content_filter";
      return true;
    }
  }
  if (body.contains("message") && body["message"].is_string()) {
    error->message = body["message"].get<std::string>();
    return !error->message.empty();
  }
  return false;
}

}  // namespace

CanonicalError NormalizeUpstreamError(const std::string& body, int status) {
  CanonicalError error;
  error.code = "upstream_error";
  auto parsed = json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && FromErrorObject(parsed, &error)) {
    if (error.code.empty()) {
      error.code = "upstream_error";
    }
    return error;
  }
  error.code = "upstream_error";
  // HTML or latin-1 error pages are common; keep the message valid UTF-8.
  std::string raw = utf8::Truncate(body, kMaxRawErrorBytes);
  error.message = "Upstream error (status " + std::to_string(status) + ")";
  if (!raw.empty()) {
    error.message += ": " + raw;
  }
  return error;
}

CanonicalError ProviderAdapter::FromUpstreamError(const std::string& body,
                                                  int status) const {
  return NormalizeUpstreamError(body, status);
}

const ProviderAdapter& AdapterFor(WireFormat format) {
  static const OpenAIAdapter kOpenAI;
  static const AnthropicAdapter kAnthropic;
  static const GeminiAdapter kGemini;
  switch (format) {
    case WireFormat::kAnthropic:
      return kAnthropic;
    case WireFormat::kGemini:
      return kGemini;
    case WireFormat::kOpenAI:
      break;
  }
  return kOpenAI;
}

}  // namespace sentinel
