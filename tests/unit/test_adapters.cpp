#include <catch2/catch_test_macros.hpp>

#include "gateway/adapters/anthropic_adapter.h"
#include "gateway/adapters/gemini_adapter.h"
#include "gateway/adapters/openai_adapter.h"
#include "gateway/adapters/provider_adapter.h"

#include <stdexcept>
#include <string>

using sentinel::json;
using sentinel::WireFormat;

namespace {

sentinel::CanonicalRequest SampleRequest() {
  sentinel::CanonicalRequest request;
  request.model = "model-x";
  request.messages = {{"system", "Be terse.", ""},
                      {"system", "Answer in English.", ""},
                      {"user", "Hi", ""},
                      {"user", "Are you there?", ""},
                      {"assistant", "Yes.", ""},
                      {"user", "Good.", ""}};
  request.temperature = 0.3;
  request.top_p = 0.8;
  request.stop = {"\n\n"};
  request.presence_penalty = 0.1;
  request.frequency_penalty = 0.2;
  return request;
}

}  // namespace

TEST_CASE("AdapterFor returns the matching family", "[adapter]") {
  REQUIRE(sentinel::AdapterFor(WireFormat::kOpenAI).Format() ==
          WireFormat::kOpenAI);
  REQUIRE(sentinel::AdapterFor(WireFormat::kAnthropic).Format() ==
          WireFormat::kAnthropic);
  REQUIRE(sentinel::AdapterFor(WireFormat::kGemini).Format() ==
          WireFormat::kGemini);
  REQUIRE(&sentinel::AdapterFor(WireFormat::kGemini) ==
          &sentinel::AdapterFor(WireFormat::kGemini));
}

TEST_CASE("OpenAI adapter is an identity translation", "[adapter][openai]") {
  sentinel::OpenAIAdapter adapter;
  auto request = SampleRequest();
  json upstream = adapter.ToUpstream(request);
  REQUIRE(upstream == sentinel::ToJson(request));

  json body = json::parse(R"({"id": "c1", "model": "gpt-4o", "choices": [
      {"index": 0, "message": {"role": "assistant", "content": "Hello"},
       "finish_reason": "length"}]})");
  sentinel::CanonicalResponse response;
  std::string error;
  REQUIRE(adapter.FromUpstream(body, &response, &error));
  REQUIRE(response.choices[0].message.content == "Hello");
  REQUIRE(response.choices[0].finish_reason == "length");
}

TEST_CASE("OpenAI stream events", "[adapter][openai]") {
  sentinel::OpenAIAdapter adapter;
  sentinel::StreamDelta delta;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"choices":[{"delta":{"content":"Hel"},"finish_reason":null}]})",
      &delta));
  REQUIRE(delta.content == "Hel");

  sentinel::StreamDelta finish;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"choices":[{"delta":{},"finish_reason":"stop"}]})", &finish));
  REQUIRE(finish.finish_reason == "stop");

  sentinel::StreamDelta done;
  REQUIRE(adapter.ParseStreamEvent("[DONE]", &done));
  REQUIRE(done.done);

  sentinel::StreamDelta ignored;
  REQUIRE_FALSE(adapter.ParseStreamEvent(R"({"choices":[]})", &ignored));
  REQUIRE_FALSE(adapter.ParseStreamEvent("not json", &ignored));
  REQUIRE_THROWS_AS(
      adapter.ParseStreamEvent(R"({"error":{"message":"overloaded"}})",
                               &ignored),
      std::runtime_error);
}

TEST_CASE("Anthropic request translation", "[adapter][anthropic]") {
  sentinel::AnthropicAdapter adapter;
  json upstream = adapter.ToUpstream(SampleRequest());
  REQUIRE(upstream["model"] == "model-x");
  REQUIRE(upstream["system"] == "Be terse.\nAnswer in English.");
  REQUIRE(upstream["messages"].size() == 3);
  REQUIRE(upstream["messages"][0]["role"] == "user");
  REQUIRE(upstream["messages"][0]["content"] == "Hi\n\nAre you there?");
  REQUIRE(upstream["messages"][1]["role"] == "assistant");
  REQUIRE(upstream["max_tokens"] == 1024);
  REQUIRE(upstream["stop_sequences"] == json::array({"\n\n"}));
  REQUIRE(upstream["temperature"] == 0.3);
  REQUIRE_FALSE(upstream.contains("presence_penalty"));
  REQUIRE_FALSE(upstream.contains("frequency_penalty"));
  REQUIRE_FALSE(upstream.contains("stream"));

  auto request = SampleRequest();
  request.max_tokens = 50;
  request.stream = true;
  json explicit_max = adapter.ToUpstream(request);
  REQUIRE(explicit_max["max_tokens"] == 50);
  REQUIRE(explicit_max["stream"] == true);
}

TEST_CASE("Anthropic response translation", "[adapter][anthropic]") {
  sentinel::AnthropicAdapter adapter;
  json body = json::parse(R"({
    "id": "msg_1", "model": "claude-3-haiku",
    "content": [{"type": "text", "text": "Hello"},
                {"type": "text", "text": " world"}],
    "stop_reason": "max_tokens",
    "usage": {"input_tokens": 5, "output_tokens": 2}
  })");
  sentinel::CanonicalResponse response;
  std::string error;
  REQUIRE(adapter.FromUpstream(body, &response, &error));
  REQUIRE(response.id == "msg_1");
  REQUIRE(response.choices.size() == 1);
  REQUIRE(response.choices[0].message.content == "Hello world");
  REQUIRE(response.choices[0].finish_reason == "length");
  REQUIRE(response.usage.total_tokens == 7);

  REQUIRE_FALSE(adapter.FromUpstream(json::parse(R"({"id": "x"})"), &response,
                                     &error));

  REQUIRE(sentinel::AnthropicAdapter::MapStopReason("end_turn") == "stop");
  REQUIRE(sentinel::AnthropicAdapter::MapStopReason("stop_sequence") == "stop");
  REQUIRE(sentinel::AnthropicAdapter::MapStopReason("refusal") ==
          "content_filter");
  REQUIRE(sentinel::AnthropicAdapter::MapStopReason("tool_use") == "other");
}

TEST_CASE("Anthropic stream events", "[adapter][anthropic]") {
  sentinel::AnthropicAdapter adapter;
  sentinel::StreamDelta delta;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"Hi"}})",
      &delta));
  REQUIRE(delta.content == "Hi");

  sentinel::StreamDelta stop;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"type":"message_delta","delta":{"stop_reason":"end_turn"}})", &stop));
  REQUIRE(stop.finish_reason == "stop");

  sentinel::StreamDelta done;
  REQUIRE(adapter.ParseStreamEvent(R"({"type":"message_stop"})", &done));
  REQUIRE(done.done);

  sentinel::StreamDelta ping;
  REQUIRE_FALSE(adapter.ParseStreamEvent(R"({"type":"ping"})", &ping));
  REQUIRE_THROWS_AS(
      adapter.ParseStreamEvent(
          R"({"type":"error","error":{"type":"overloaded_error","message":"busy"}})",
          &ping),
      std::runtime_error);
}

TEST_CASE("Gemini request translation", "[adapter][gemini]") {
  sentinel::GeminiAdapter adapter;
  auto request = SampleRequest();
  request.max_tokens = 100;
  json upstream = adapter.ToUpstream(request);
  REQUIRE(upstream["systemInstruction"]["parts"][0]["text"] ==
          "Be terse.\nAnswer in English.");
  REQUIRE(upstream["contents"].size() == 4);
  REQUIRE(upstream["contents"][0]["role"] == "user");
  REQUIRE(upstream["contents"][2]["role"] == "model");
  REQUIRE(upstream["contents"][2]["parts"][0]["text"] == "Yes.");
  const auto& config = upstream["generationConfig"];
  REQUIRE(config["temperature"] == 0.3);
  REQUIRE(config["topP"] == 0.8);
  REQUIRE(config["maxOutputTokens"] == 100);
  REQUIRE(config["stopSequences"] == json::array({"\n\n"}));
  REQUIRE(config["presencePenalty"] == 0.1);
  REQUIRE(config["frequencyPenalty"] == 0.2);
  REQUIRE_FALSE(upstream.contains("model"));
}

TEST_CASE("Gemini response translation", "[adapter][gemini]") {
  sentinel::GeminiAdapter adapter;
  json body = json::parse(R"({
    "candidates": [{"content": {"role": "model",
                                "parts": [{"text": "Bonjour"}]},
                    "finishReason": "STOP"}],
    "usageMetadata": {"promptTokenCount": 4, "candidatesTokenCount": 1,
                      "totalTokenCount": 5},
    "modelVersion": "gemini-1.5-pro-002",
    "responseId": "r-1"
  })");
  sentinel::CanonicalResponse response;
  std::string error;
  REQUIRE(adapter.FromUpstream(body, &response, &error));
  REQUIRE(response.id == "r-1");
  REQUIRE(response.model == "gemini-1.5-pro-002");
  REQUIRE(response.choices[0].message.content == "Bonjour");
  REQUIRE(response.choices[0].finish_reason == "stop");
  REQUIRE(response.usage.total_tokens == 5);

  json blocked = json::parse(
      R"({"promptFeedback": {"blockReason": "SAFETY"}})");
  REQUIRE(adapter.FromUpstream(blocked, &response, &error));
  REQUIRE(response.choices[0].finish_reason == "content_filter");
  REQUIRE(response.choices[0].message.content.empty());

  REQUIRE_FALSE(adapter.FromUpstream(json::parse("{}"), &response, &error));

  REQUIRE(sentinel::GeminiAdapter::MapFinishReason("MAX_TOKENS") == "length");
  REQUIRE(sentinel::GeminiAdapter::MapFinishReason("SAFETY") ==
          "content_filter");
  REQUIRE(sentinel::GeminiAdapter::MapFinishReason("OTHER") == "other");
}

TEST_CASE("Gemini stream events", "[adapter][gemini]") {
  sentinel::GeminiAdapter adapter;
  sentinel::StreamDelta delta;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"candidates":[{"content":{"parts":[{"text":"Hel"}]}}]})", &delta));
  REQUIRE(delta.content == "Hel");

  sentinel::StreamDelta last;
  REQUIRE(adapter.ParseStreamEvent(
      R"({"candidates":[{"content":{"parts":[{"text":"lo"}]},"finishReason":"STOP"}]})",
      &last));
  REQUIRE(last.content == "lo");
  REQUIRE(last.finish_reason == "stop");

  sentinel::StreamDelta meta;
  REQUIRE_FALSE(adapter.ParseStreamEvent(R"({"usageMetadata":{}})", &meta));
}

TEST_CASE("Upstream errors are normalized", "[adapter]") {
  SECTION("OpenAI error object") {
    auto error = sentinel::NormalizeUpstreamError(
        R"({"error":{"message":"Invalid API key","type":"invalid_request_error","code":"invalid_api_key"}})",
        401);
    REQUIRE(error.message == "Invalid API key");
    REQUIRE(error.code == "invalid_api_key");
  }
  SECTION("Anthropic error type") {
    auto error = sentinel::NormalizeUpstreamError(
        R"({"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}})",
        529);
    REQUIRE(error.message == "Overloaded");
    REQUIRE(error.code == "overloaded_error");
  }
  SECTION("Gemini error array with status") {
    auto error = sentinel::NormalizeUpstreamError(
        R"([{"error":{"code":400,"message":"API key not valid","status":"INVALID_ARGUMENT"}}])",
        400);
    REQUIRE(error.message == "API key not valid");
    REQUIRE(error.code == "400");
  }
  SECTION("Gemini safety block") {
    auto error = sentinel::NormalizeUpstreamError(
        R"({"promptFeedback":{"blockReason":"SAFETY"}})", 200);
    REQUIRE(error.code == "content_filter");
  }
  SECTION("Plain error string") {
    auto error =
        sentinel::NormalizeUpstreamError(R"({"error":"model not found"})", 404);
    REQUIRE(error.message == "model not found");
    REQUIRE(error.code == "upstream_error");
  }
  SECTION("Raw text body is truncated") {
    std::string body(1000, 'x');
    auto error = sentinel::NormalizeUpstreamError(body, 503);
    REQUIRE(error.code == "upstream_error");
    REQUIRE(error.message ==
            "Upstream error (status 503): " + std::string(256, 'x'));
  }
  SECTION("Truncation never splits a character") {
    std::string body = std::string(255, 'a') + "\xC3\xA9" + "tail";
    auto error = sentinel::AdapterFor(WireFormat::kOpenAI)
                     .FromUpstreamError(body, 502);
    REQUIRE(error.message ==
            "Upstream error (status 502): " + std::string(255, 'a'));
    REQUIRE_NOTHROW(sentinel::ErrorBody(error).dump());
  }
  SECTION("Latin-1 body is made valid UTF-8") {
    auto error = sentinel::NormalizeUpstreamError("Gr\xFC\xDF Gott", 500);
    REQUIRE(error.message ==
            "Upstream error (status 500): Gr\xEF\xBF\xBD\xEF\xBF\xBD Gott");
    REQUIRE_NOTHROW(sentinel::ErrorBody(error).dump());
  }
  SECTION("Empty body") {
    auto error = sentinel::NormalizeUpstreamError("", 502);
    REQUIRE(error.message == "Upstream error (status 502)");
  }
  SECTION("Adapters share the normalization") {
    auto error = sentinel::AdapterFor(WireFormat::kAnthropic)
                     .FromUpstreamError("<html>Bad Gateway</html>", 502);
    REQUIRE(error.message ==
            "Upstream error (status 502): <html>Bad Gateway</html>");
  }
}

TEST_CASE("Translated requests come back as assistant text", "[adapter]") {
  auto request = SampleRequest();

  SECTION("anthropic") {
    sentinel::AnthropicAdapter adapter;
    json upstream = adapter.ToUpstream(request);
    const auto last = upstream["messages"].back()["content"].get<std::string>();
    json reply = {{"id", "msg_rt"},
                  {"content", json::array({{{"type", "text"},
                                            {"text", "echo: " + last}}})},
                  {"stop_reason", "end_turn"}};
    sentinel::CanonicalResponse response;
    std::string error;
    REQUIRE(adapter.FromUpstream(reply, &response, &error));
    REQUIRE(response.choices[0].message.role == "assistant");
    REQUIRE(response.choices[0].message.content == "echo: Good.");
  }
  SECTION("gemini") {
    sentinel::GeminiAdapter adapter;
    json upstream = adapter.ToUpstream(request);
    const auto last =
        upstream["contents"].back()["parts"][0]["text"].get<std::string>();
    json reply = {
        {"candidates",
         json::array({{{"content",
                        {{"role", "model"},
                         {"parts", json::array({{{"text", "echo: " + last}}})}}},
                       {"finishReason", "STOP"}}})}};
    sentinel::CanonicalResponse response;
    std::string error;
    REQUIRE(adapter.FromUpstream(reply, &response, &error));
    REQUIRE(response.choices[0].message.role == "assistant");
    REQUIRE(response.choices[0].message.content == "echo: Good.");
  }
}
