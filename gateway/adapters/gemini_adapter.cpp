#include "gateway/adapters/gemini_adapter.h"

#include <stdexcept>

namespace sentinel {

namespace {

// Text of the first candidate plus its mapped finish reason. A prompt-level
// block (no candidates, promptFeedback.blockReason) maps to content_filter.
bool ReadCandidate(const json& body, std::string* text,
                   std::string* finish_reason) {
  bool found = false;
  if (body.contains("candidates") && body["candidates"].is_array() &&
      !body["candidates"].empty()) {
    const auto& candidate = body["candidates"].front();
    found = true;
    if (candidate.contains("content") && candidate["content"].is_object() &&
        candidate["content"].contains("parts") &&
        candidate["content"]["parts"].is_array()) {
      for (const auto& part : candidate["content"]["parts"]) {
        if (part.is_object() && part.contains("text") &&
            part["text"].is_string()) {
          *text += part["text"].get<std::string>();
        }
      }
    }
    if (candidate.contains("finishReason") &&
        candidate["finishReason"].is_string()) {
      *finish_reason = GeminiAdapter::MapFinishReason(
          candidate["finishReason"].get<std::string>());
    }
  }
  if (body.contains("promptFeedback") && body["promptFeedback"].is_object() &&
      body["promptFeedback"].contains("blockReason")) {
    *finish_reason = "content_filter";
    found = true;
  }
  return found;
}

}  // namespace

std::string GeminiAdapter::MapFinishReason(const std::string& finish_reason) {
  if (finish_reason == "STOP") {
    return "stop";
  }
  if (finish_reason == "MAX_TOKENS") {
    return "length";
  }
  if (finish_reason == "SAFETY" || finish_reason == "RECITATION" ||
      finish_reason == "BLOCKLIST" || finish_reason == "PROHIBITED_CONTENT" ||
      finish_reason == "SPII") {
    return "content_filter";
  }
  return "other";
}

json GeminiAdapter::ToUpstream(const CanonicalRequest& request) const {
  json j;
  json contents = json::array();
  std::string system;
  for (const auto& message : request.messages) {
    if (message.role == "system") {
      if (!system.empty()) {
        system += "\n";
      }
      system += message.content;
      continue;
    }
    const char* role = message.role == "assistant" ? "model" : "user";
    contents.push_back(
        {{"role", role}, {"parts", json::array({{{"text", message.content}}})}});
  }
  j["contents"] = contents;
  if (!system.empty()) {
    j["systemInstruction"] = {{"parts", json::array({{{"text", system}}})}};
  }
  json config = json::object();
  if (request.temperature) config["temperature"] = *request.temperature;
  if (request.top_p) config["topP"] = *request.top_p;
  if (request.max_tokens) config["maxOutputTokens"] = *request.max_tokens;
  if (!request.stop.empty()) config["stopSequences"] = request.stop;
  if (request.presence_penalty) {
    config["presencePenalty"] = *request.presence_penalty;
  }
  if (request.frequency_penalty) {
    config["frequencyPenalty"] = *request.frequency_penalty;
  }
  if (!config.empty()) {
    j["generationConfig"] = config;
  }
  return j;
}

bool GeminiAdapter::FromUpstream(const json& body, CanonicalResponse* response,
                                 std::string* error) const {
  if (!body.is_object()) {
    *error = "gemini response is not an object";
    return false;
  }
  CanonicalChoice choice;
  choice.message.role = "assistant";
  if (!ReadCandidate(body, &choice.message.content, &choice.finish_reason)) {
    *error = "gemini response has no candidates";
    return false;
  }
  if (choice.finish_reason.empty()) {
    choice.finish_reason = "stop";
  }
  CanonicalResponse parsed;
  parsed.id = body.value("responseId", std::string());
  parsed.model = body.value("modelVersion", std::string());
  parsed.choices.push_back(std::move(choice));
  if (body.contains("usageMetadata") && body["usageMetadata"].is_object()) {
    const auto& usage = body["usageMetadata"];
    parsed.usage.prompt_tokens = usage.value("promptTokenCount", 0);
    parsed.usage.completion_tokens = usage.value("candidatesTokenCount", 0);
    parsed.usage.total_tokens =
        usage.value("totalTokenCount", parsed.usage.prompt_tokens +
                                           parsed.usage.completion_tokens);
  }
  *response = std::move(parsed);
  return true;
}

bool GeminiAdapter::ParseStreamEvent(const std::string& data,
                                     StreamDelta* delta) const {
  auto event = json::parse(data, nullptr, false);
  if (event.is_discarded() || !event.is_object()) {
    return false;
  }
  if (event.contains("error")) {
    throw std::runtime_error(NormalizeUpstreamError(data, 200).message);
  }
  if (!ReadCandidate(event, &delta->content, &delta->finish_reason)) {
    return false;
  }
  return !delta->content.empty() || !delta->finish_reason.empty();
}

}  // namespace sentinel
