#include "gateway/adapters/openai_adapter.h"

#include <stdexcept>

namespace sentinel {

json OpenAIAdapter::ToUpstream(const CanonicalRequest& request) const {
  return ToJson(request);
}

bool OpenAIAdapter::FromUpstream(const json& body, CanonicalResponse* response,
                                 std::string* error) const {
  return ParseCanonicalResponse(body, response, error);
}

bool OpenAIAdapter::ParseStreamEvent(const std::string& data,
                                     StreamDelta* delta) const {
  if (data == "[DONE]") {
    delta->done = true;
    return true;
  }
  auto event = json::parse(data, nullptr, false);
  if (event.is_discarded() || !event.is_object()) {
    return false;
  }
  if (event.contains("error")) {
    throw std::runtime_error(NormalizeUpstreamError(data, 200).message);
  }
  if (!event.contains("choices") || !event["choices"].is_array() ||
      event["choices"].empty()) {
    return false;
  }
  const auto& choice = event["choices"].front();
  bool any = false;
  if (choice.contains("delta") && choice["delta"].is_object()) {
    const auto& d = choice["delta"];
    if (d.contains("content") && d["content"].is_string()) {
      delta->content = d["content"].get<std::string>();
      any = true;
    }
  }
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    delta->finish_reason = choice["finish_reason"].get<std::string>();
    any = true;
  }
  return any;
}

}  // namespace sentinel
