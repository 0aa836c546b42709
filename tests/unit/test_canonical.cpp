#include <catch2/catch_test_macros.hpp>

#include "gateway/canonical.h"

#include <string>

using sentinel::json;

TEST_CASE("ParseCanonicalRequest reads the chat-completions shape",
          "[canonical]") {
  json body = json::parse(R"({
    "model": "gpt-4o",
    "messages": [
      {"role": "system", "content": "Be brief."},
      {"role": "user", "content": [{"type": "text", "text": "Hello "},
                                   {"type": "text", "text": "there"}],
       "name": "alice"}
    ],
    "temperature": 0.2,
    "top_p": 0.9,
    "max_tokens": 64,
    "stop": "END",
    "presence_penalty": 0.5,
    "stream": true,
    "user": "tenant-7"
  })");
  sentinel::CanonicalRequest request;
  std::string error;
  REQUIRE(sentinel::ParseCanonicalRequest(body, &request, &error));
  REQUIRE(request.model == "gpt-4o");
  REQUIRE(request.messages.size() == 2);
  REQUIRE(request.messages[1].content == "Hello there");
  REQUIRE(request.messages[1].name == "alice");
  REQUIRE(*request.temperature == 0.2);
  REQUIRE(*request.max_tokens == 64);
  REQUIRE(request.stop == std::vector<std::string>{"END"});
  REQUIRE(*request.presence_penalty == 0.5);
  REQUIRE_FALSE(request.frequency_penalty.has_value());
  REQUIRE(request.stream);
  REQUIRE(request.passthrough["user"] == "tenant-7");
}

TEST_CASE("ParseCanonicalRequest rejects invalid bodies", "[canonical]") {
  sentinel::CanonicalRequest request;
  std::string error;

  auto rejects = [&](const char* text) {
    error.clear();
    return !sentinel::ParseCanonicalRequest(json::parse(text), &request,
                                            &error) &&
           !error.empty();
  };

  REQUIRE(rejects(R"([])"));
  REQUIRE(rejects(R"({"messages": [{"role": "user", "content": "x"}]})"));
  REQUIRE(rejects(R"({"model": "m", "messages": []})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "tool", "content": "x"}]})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "user", "content": [{"type": "image_url"}]}]})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "user", "content": "x"}], "max_tokens": 0})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "user", "content": "x"}], "stream": "yes"})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "user", "content": "x"}], "stop": [1]})"));
  REQUIRE(rejects(R"({"model": "m", "messages": [{"role": "user", "content": "x"}], "temperature": "hot"})"));
}

TEST_CASE("Request ToJson keeps passthrough fields", "[canonical]") {
  sentinel::CanonicalRequest request;
  request.model = "llama3";
  request.messages.push_back({"user", "hi", ""});
  request.max_tokens = 10;
  request.stop = {"a", "b"};
  request.passthrough["seed"] = 42;
  json j = sentinel::ToJson(request);
  REQUIRE(j["model"] == "llama3");
  REQUIRE(j["messages"][0]["content"] == "hi");
  REQUIRE_FALSE(j["messages"][0].contains("name"));
  REQUIRE(j["max_tokens"] == 10);
  REQUIRE(j["stop"] == json::array({"a", "b"}));
  REQUIRE(j["seed"] == 42);
  REQUIRE_FALSE(j.contains("temperature"));
  REQUIRE_FALSE(j.contains("stream"));
}

TEST_CASE("ParseCanonicalResponse and ToJson", "[canonical]") {
  json body = json::parse(R"({
    "id": "chatcmpl-1", "model": "gpt-4o", "created": 1700000000,
    "choices": [{"index": 0, "message": {"role": "assistant", "content": "Hi"},
                 "finish_reason": "stop"}],
    "usage": {"prompt_tokens": 3, "completion_tokens": 1}
  })");
  sentinel::CanonicalResponse response;
  std::string error;
  REQUIRE(sentinel::ParseCanonicalResponse(body, &response, &error));
  REQUIRE(response.id == "chatcmpl-1");
  REQUIRE(response.created == 1700000000);
  REQUIRE(response.choices.size() == 1);
  REQUIRE(response.choices[0].message.content == "Hi");
  REQUIRE(response.usage.total_tokens == 4);

  json out = sentinel::ToJson(response);
  REQUIRE(out["object"] == "chat.completion");
  REQUIRE(out["choices"][0]["finish_reason"] == "stop");
  REQUIRE(out["usage"]["completion_tokens"] == 1);

  REQUIRE_FALSE(sentinel::ParseCanonicalResponse(json::parse(R"({"id": "x"})"),
                                                 &response, &error));
}

TEST_CASE("ErrorBody shape", "[canonical]") {
  sentinel::CanonicalError error;
  error.message = "nope";
  error.code = "bad";
  json body = sentinel::ErrorBody(error);
  REQUIRE(body["error"]["message"] == "nope");
  REQUIRE(body["error"]["code"] == "bad");
  REQUIRE(body["error"]["type"] == "upstream_error");
}

TEST_CASE("BuildStreamChunk frames SSE chunks", "[canonical]") {
  std::string frame =
      sentinel::BuildStreamChunk("chatcmpl-x", "m", 1, "Hello");
  REQUIRE(frame.rfind("data: ", 0) == 0);
  REQUIRE(frame.size() > 2);
  REQUIRE(frame.substr(frame.size() - 2) == "\n\n");
  json chunk = json::parse(frame.substr(6));
  REQUIRE(chunk["object"] == "chat.completion.chunk");
  REQUIRE(chunk["choices"][0]["delta"]["content"] == "Hello");
  REQUIRE(chunk["choices"][0]["finish_reason"].is_null());

  json last = json::parse(
      sentinel::BuildStreamChunk("chatcmpl-x", "m", 1, "", "stop").substr(6));
  REQUIRE(last["choices"][0]["finish_reason"] == "stop");
  REQUIRE(last["choices"][0]["delta"].empty());

  REQUIRE(std::string(sentinel::kStreamDoneFrame) == "data: [DONE]\n\n");
}

TEST_CASE("Completion ids and last user content", "[canonical]") {
  auto id = sentinel::NewCompletionId();
  REQUIRE(id.rfind("chatcmpl-", 0) == 0);
  REQUIRE(id.size() == 9 + 24);
  REQUIRE(id != sentinel::NewCompletionId());

  sentinel::CanonicalRequest request;
  request.messages = {{"system", "s", ""}, {"user", "first", ""},
                      {"assistant", "a", ""}, {"user", "second", ""}};
  REQUIRE(sentinel::LastUserContent(request) == "second");
}
