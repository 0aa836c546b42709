#include "gateway/canonical.h"

#include <chrono>
#include <random>
#include <set>

namespace sentinel {

const char kStreamDoneFrame[] = "data: [DONE]\n\n";

namespace {

const std::set<std::string>& KnownRequestFields() {
  static const std::set<std::string> kFields = {
      "model", "messages", "temperature", "top_p", "max_tokens", "stop",
      "presence_penalty", "frequency_penalty", "stream"};
  return kFields;
}

bool ReadNumber(const json& body, const char* field,
                std::optional<double>* out, std::string* error) {
  if (!body.contains(field) || body[field].is_null()) {
    return true;
  }
  if (!body[field].is_number()) {
    *error = std::string(field) + " must be a number";
    return false;
  }
  *out = body[field].get<double>();
  return true;
}

// Accepts a plain string or an array of {"type":"text","text":...} parts.
bool ReadContent(const json& value, std::string* out, std::string* error) {
  if (value.is_null()) {
    out->clear();
    return true;
  }
  if (value.is_string()) {
    *out = value.get<std::string>();
    return true;
  }
  if (!value.is_array()) {
    *error = "message content must be a string or a list of text parts";
    return false;
  }
  out->clear();
  for (const auto& part : value) {
    if (!part.is_object() || part.value("type", "") != "text" ||
        !part.contains("text") || !part["text"].is_string()) {
      *error = "only text content parts are supported";
      return false;
    }
    *out += part["text"].get<std::string>();
  }
  return true;
}

std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

bool ParseCanonicalRequest(const json& body, CanonicalRequest* request,
                           std::string* error) {
  if (!body.is_object()) {
    *error = "request body must be a JSON object";
    return false;
  }
  CanonicalRequest parsed;
  if (!body.contains("model") || !body["model"].is_string() ||
      body["model"].get<std::string>().empty()) {
    *error = "model is required";
    return false;
  }
  parsed.model = body["model"].get<std::string>();
  if (!body.contains("messages") || !body["messages"].is_array() ||
      body["messages"].empty()) {
    *error = "messages must be a non-empty list";
    return false;
  }
  for (const auto& item : body["messages"]) {
    if (!item.is_object() || !item.contains("role") ||
        !item["role"].is_string()) {
      *error = "each message needs a role";
      return false;
    }
    ChatMessage message;
    message.role = item["role"].get<std::string>();
    if (message.role != "system" && message.role != "user" &&
        message.role != "assistant") {
      *error = "unsupported message role '" + message.role + "'";
      return false;
    }
    if (!ReadContent(item.contains("content") ? item["content"] : json(),
                     &message.content, error)) {
      return false;
    }
    if (item.contains("name") && item["name"].is_string()) {
      message.name = item["name"].get<std::string>();
    }
    parsed.messages.push_back(std::move(message));
  }
  if (!ReadNumber(body, "temperature", &parsed.temperature, error) ||
      !ReadNumber(body, "top_p", &parsed.top_p, error) ||
      !ReadNumber(body, "presence_penalty", &parsed.presence_penalty, error) ||
      !ReadNumber(body, "frequency_penalty", &parsed.frequency_penalty,
                  error)) {
    return false;
  }
  if (body.contains("max_tokens") && !body["max_tokens"].is_null()) {
    if (!body["max_tokens"].is_number_integer() ||
        body["max_tokens"].get<int>() <= 0) {
      *error = "max_tokens must be a positive integer";
      return false;
    }
    parsed.max_tokens = body["max_tokens"].get<int>();
  }
  if (body.contains("stop") && !body["stop"].is_null()) {
    const auto& stop = body["stop"];
    if (stop.is_string()) {
      parsed.stop.push_back(stop.get<std::string>());
    } else if (stop.is_array()) {
      for (const auto& s : stop) {
        if (!s.is_string()) {
          *error = "stop must be a string or a list of strings";
          return false;
        }
        parsed.stop.push_back(s.get<std::string>());
      }
    } else {
      *error = "stop must be a string or a list of strings";
      return false;
    }
  }
  if (body.contains("stream")) {
    if (!body["stream"].is_boolean()) {
      *error = "stream must be a boolean";
      return false;
    }
    parsed.stream = body["stream"].get<bool>();
  }
  for (auto it = body.begin(); it != body.end(); ++it) {
    if (!KnownRequestFields().count(it.key())) {
      parsed.passthrough[it.key()] = it.value();
    }
  }
  *request = std::move(parsed);
  return true;
}

json ToJson(const CanonicalRequest& request) {
  json j = request.passthrough.is_object() ? request.passthrough
                                           : json::object();
  j["model"] = request.model;
  j["messages"] = json::array();
  for (const auto& message : request.messages) {
    json m = {{"role", message.role}, {"content", message.content}};
    if (!message.name.empty()) {
      m["name"] = message.name;
    }
    j["messages"].push_back(std::move(m));
  }
  if (request.temperature) j["temperature"] = *request.temperature;
  if (request.top_p) j["top_p"] = *request.top_p;
  if (request.max_tokens) j["max_tokens"] = *request.max_tokens;
  if (!request.stop.empty()) j["stop"] = request.stop;
  if (request.presence_penalty) j["presence_penalty"] = *request.presence_penalty;
  if (request.frequency_penalty) {
    j["frequency_penalty"] = *request.frequency_penalty;
  }
  if (request.stream) j["stream"] = true;
  return j;
}

bool ParseCanonicalResponse(const json& body, CanonicalResponse* response,
                            std::string* error) {
  if (!body.is_object() || !body.contains("choices") ||
      !body["choices"].is_array()) {
    *error = "response has no choices";
    return false;
  }
  CanonicalResponse parsed;
  parsed.id = body.value("id", std::string());
  parsed.model = body.value("model", std::string());
  parsed.created = body.value("created", NowSeconds());
  int position = 0;
  for (const auto& item : body["choices"]) {
    if (!item.is_object()) {
      *error = "choice must be an object";
      return false;
    }
    CanonicalChoice choice;
    choice.index = item.value("index", position);
    ++position;
    const auto message = item.contains("message") ? item["message"] : json();
    choice.message.role = "assistant";
    if (message.is_object()) {
      choice.message.role = message.value("role", std::string("assistant"));
      if (message.contains("content") &&
          !ReadContent(message["content"], &choice.message.content, error)) {
        return false;
      }
    }
    if (item.contains("finish_reason") && item["finish_reason"].is_string()) {
      choice.finish_reason = item["finish_reason"].get<std::string>();
    }
    parsed.choices.push_back(std::move(choice));
  }
  if (body.contains("usage") && body["usage"].is_object()) {
    const auto& usage = body["usage"];
    parsed.usage.prompt_tokens = usage.value("prompt_tokens", 0);
    parsed.usage.completion_tokens = usage.value("completion_tokens", 0);
    parsed.usage.total_tokens =
        usage.value("total_tokens", parsed.usage.prompt_tokens +
                                        parsed.usage.completion_tokens);
  }
  *response = std::move(parsed);
  return true;
}

json ToJson(const CanonicalResponse& response) {
  json j;
  j["id"] = response.id.empty() ? NewCompletionId() : response.id;
  j["object"] = "chat.completion";
  j["created"] = response.created ? response.created : NowSeconds();
  j["model"] = response.model;
  j["choices"] = json::array();
  for (const auto& choice : response.choices) {
    j["choices"].push_back(
        {{"index", choice.index},
         {"message",
          {{"role", choice.message.role}, {"content", choice.message.content}}},
         {"finish_reason", choice.finish_reason.empty()
                               ? json(nullptr)
                               : json(choice.finish_reason)}});
  }
  j["usage"] = {{"prompt_tokens", response.usage.prompt_tokens},
                {"completion_tokens", response.usage.completion_tokens},
                {"total_tokens", response.usage.total_tokens}};
  return j;
}

json ErrorBody(const CanonicalError& error) {
  return {{"error",
           {{"message", error.message},
            {"type", error.type},
            {"code", error.code}}}};
}

std::string BuildStreamChunk(const std::string& id, const std::string& model,
                             std::time_t created, const std::string& content,
                             const std::string& finish_reason) {
  json j;
  j["id"] = id;
  j["object"] = "chat.completion.chunk";
  j["created"] = created;
  j["model"] = model;
  if (!finish_reason.empty()) {
    j["choices"] = json::array({{{"index", 0},
                                 {"delta", json::object()},
                                 {"finish_reason", finish_reason}}});
  } else {
    j["choices"] = json::array({{{"index", 0},
                                 {"delta", {{"content", content}}},
                                 {"finish_reason", nullptr}}});
  }
  return "data: " + j.dump(-1, ' ', false, json::error_handler_t::replace) +
         "\n\n";
}

std::string NewCompletionId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char kHex[] = "0123456789abcdef";
  std::string id = "chatcmpl-";
  for (int i = 0; i < 24; ++i) {
    id.push_back(kHex[rng() % 16]);
  }
  return id;
}

std::string LastUserContent(const CanonicalRequest& request) {
  for (auto it = request.messages.rbegin(); it != request.messages.rend();
       ++it) {
    if (it->role == "user") {
      return it->content;
    }
  }
  return {};
}

}  // namespace sentinel
