#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {

using json = nlohmann::json;

// The OpenAI chat-completions shape is the canonical form; every other wire
// format is translated to and from these types.

struct ChatMessage {
  std::string role;  // system | user | assistant
  std::string content;
  std::string name;  // optional
};

struct CanonicalRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<int> max_tokens;
  std::vector<std::string> stop;
  std::optional<double> presence_penalty;
  std::optional<double> frequency_penalty;
  bool stream{false};
  // Unrecognized top-level fields, forwarded verbatim to OpenAI-compatible
  // upstreams.
  json passthrough = json::object();
};

struct Usage {
  int prompt_tokens{0};
  int completion_tokens{0};
  int total_tokens{0};
};

struct CanonicalChoice {
  int index{0};
  ChatMessage message;
  std::string finish_reason;  // stop | length | content_filter | other
};

struct CanonicalResponse {
  std::string id;
  std::string model;
  std::int64_t created{0};
  std::vector<CanonicalChoice> choices;
  Usage usage;
};

struct CanonicalError {
  std::string message;
  std::string code;
  std::string type{"upstream_error"};
};

// One decoded upstream streaming event.
struct StreamDelta {
  std::string content;
  std::string finish_reason;
  bool done{false};  // Terminal event ([DONE], message_stop, ...).
};

// Validates and converts an inbound request body. Returns false and fills
// *error for a body the gateway must reject with 400.
bool ParseCanonicalRequest(const json& body, CanonicalRequest* request,
                           std::string* error);
json ToJson(const CanonicalRequest& request);

bool ParseCanonicalResponse(const json& body, CanonicalResponse* response,
                            std::string* error);
json ToJson(const CanonicalResponse& response);

// {"error": {"message", "type", "code"}}
json ErrorBody(const CanonicalError& error);

// SSE frame carrying one chat.completion.chunk. An empty finish_reason emits
// a content delta, otherwise an empty delta with the finish reason.
std::string BuildStreamChunk(const std::string& id, const std::string& model,
                             std::time_t created, const std::string& content,
                             const std::string& finish_reason = "");
extern const char kStreamDoneFrame[];

std::string NewCompletionId();
std::string LastUserContent(const CanonicalRequest& request);

}  // namespace sentinel
