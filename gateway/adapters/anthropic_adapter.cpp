#include "gateway/adapters/anthropic_adapter.h"

#include <stdexcept>

namespace sentinel {

std::string AnthropicAdapter::MapStopReason(const std::string& stop_reason) {
  if (stop_reason == "end_turn" || stop_reason == "stop_sequence") {
    return "stop";
  }
  if (stop_reason == "max_tokens") {
    return "length";
  }
  if (stop_reason == "refusal") {
    return "content_filter";
  }
  return "other";
}

json AnthropicAdapter::ToUpstream(const CanonicalRequest& request) const {
  json j;
  j["model"] = request.model;
  std::string system;
  json messages = json::array();
  for (const auto& message : request.messages) {
    if (message.role == "system") {
      if (!system.empty()) {
        system += "\n";
      }
      system += message.content;
      continue;
    }
    // The API rejects consecutive turns from the same role; merge them.
    if (!messages.empty() && messages.back()["role"] == message.role) {
      auto merged = messages.back()["content"].get<std::string>();
      messages.back()["content"] = merged + "\n\n" + message.content;
      continue;
    }
    messages.push_back({{"role", message.role}, {"content", message.content}});
  }
  if (!system.empty()) {
    j["system"] = system;
  }
  j["messages"] = messages;
  j["max_tokens"] = request.max_tokens.value_or(kDefaultMaxTokens);
  if (request.temperature) j["temperature"] = *request.temperature;
  if (request.top_p) j["top_p"] = *request.top_p;
  if (!request.stop.empty()) j["stop_sequences"] = request.stop;
  if (request.stream) j["stream"] = true;
  return j;
}

bool AnthropicAdapter::FromUpstream(const json& body,
                                    CanonicalResponse* response,
                                    std::string* error) const {
  if (!body.is_object() || !body.contains("content") ||
      !body["content"].is_array()) {
    *error = "anthropic response has no content blocks";
    return false;
  }
  CanonicalResponse parsed;
  parsed.id = body.value("id", std::string());
  parsed.model = body.value("model", std::string());
  CanonicalChoice choice;
  choice.message.role = "assistant";
  for (const auto& block : body["content"]) {
    if (block.is_object() && block.value("type", "") == "text" &&
        block.contains("text") && block["text"].is_string()) {
      choice.message.content += block["text"].get<std::string>();
    }
  }
  if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
    choice.finish_reason = MapStopReason(body["stop_reason"].get<std::string>());
  } else {
    choice.finish_reason = "stop";
  }
  parsed.choices.push_back(std::move(choice));
  if (body.contains("usage") && body["usage"].is_object()) {
    parsed.usage.prompt_tokens = body["usage"].value("input_tokens", 0);
    parsed.usage.completion_tokens = body["usage"].value("output_tokens", 0);
    parsed.usage.total_tokens =
        parsed.usage.prompt_tokens + parsed.usage.completion_tokens;
  }
  *response = std::move(parsed);
  return true;
}

bool AnthropicAdapter::ParseStreamEvent(const std::string& data,
                                        StreamDelta* delta) const {
  auto event = json::parse(data, nullptr, false);
  if (event.is_discarded() || !event.is_object()) {
    return false;
  }
  const std::string type = event.value("type", std::string());
  if (type == "content_block_delta" && event.contains("delta") &&
      event["delta"].is_object()) {
    const auto& d = event["delta"];
    if (d.value("type", "") == "text_delta" && d.contains("text") &&
        d["text"].is_string()) {
      delta->content = d["text"].get<std::string>();
      return true;
    }
    return false;
  }
  if (type == "message_delta" && event.contains("delta") &&
      event["delta"].is_object() && event["delta"].contains("stop_reason") &&
      event["delta"]["stop_reason"].is_string()) {
    delta->finish_reason =
        MapStopReason(event["delta"]["stop_reason"].get<std::string>());
    return true;
  }
  if (type == "message_stop") {
    delta->done = true;
    return true;
  }
  if (type == "error") {
    throw std::runtime_error(NormalizeUpstreamError(data, 200).message);
  }
  return false;
}

}  // namespace sentinel
