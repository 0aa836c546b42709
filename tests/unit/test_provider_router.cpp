#include <catch2/catch_test_macros.hpp>

#include "gateway/provider_router.h"

#include <string>

using sentinel::WireFormat;

namespace {

sentinel::ProviderRouter MakeRouter() {
  sentinel::RouterConfig config;
  config.credentials.openai_api_key = "sk-openai";
  config.credentials.anthropic_api_key = "ak-anthropic";
  config.credentials.gemini_api_key = "gk-gemini";
  config.credentials.xai_api_key = "xk-xai";
  config.fallback_endpoint = "http://local-llm:8000/v1/chat/completions";
  return sentinel::ProviderRouter(config);
}

}  // namespace

TEST_CASE("OpenAI family prefixes", "[router]") {
  auto router = MakeRouter();
  for (const char* model :
       {"gpt-4o", "GPT-4o-mini", "chatgpt-4o-latest", "o1-preview", "o3-mini",
        "o4-mini", "text-davinci-003"}) {
    auto target = router.Resolve(model);
    INFO(model);
    REQUIRE(target.provider == "openai");
    REQUIRE(target.wire_format == WireFormat::kOpenAI);
    REQUIRE(target.endpoint_url ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(target.headers.at("Authorization") == "Bearer sk-openai");
  }
}

TEST_CASE("Anthropic route carries version and key headers", "[router]") {
  auto target = MakeRouter().Resolve("claude-3-5-sonnet-latest");
  REQUIRE(target.provider == "anthropic");
  REQUIRE(target.wire_format == WireFormat::kAnthropic);
  REQUIRE(target.endpoint_url == "https://api.anthropic.com/v1/messages");
  REQUIRE(target.headers.at("x-api-key") == "ak-anthropic");
  REQUIRE(target.headers.at("anthropic-version") == "2023-06-01");
  REQUIRE(target.headers.count("Authorization") == 0);
}

TEST_CASE("Gemini route embeds the model in the URL", "[router]") {
  auto target = MakeRouter().Resolve("gemini-1.5-pro");
  REQUIRE(target.provider == "gemini");
  REQUIRE(target.wire_format == WireFormat::kGemini);
  REQUIRE(target.endpoint_url ==
          "https://generativelanguage.googleapis.com/v1beta/models/"
          "gemini-1.5-pro:generateContent");
  REQUIRE(target.stream_endpoint_url ==
          "https://generativelanguage.googleapis.com/v1beta/models/"
          "gemini-1.5-pro:streamGenerateContent?alt=sse");
  REQUIRE(target.headers.at("x-goog-api-key") == "gk-gemini");
}

TEST_CASE("Gemini model names cannot rewrite the URL path", "[router]") {
  auto target = MakeRouter().Resolve("gemini-x/../../v1beta/files?");
  REQUIRE(target.provider == "gemini");
  REQUIRE(target.endpoint_url ==
          "https://generativelanguage.googleapis.com/v1beta/models/"
          "gemini-x%2F..%2F..%2Fv1beta%2Ffiles%3F:generateContent");
  REQUIRE(target.stream_endpoint_url ==
          "https://generativelanguage.googleapis.com/v1beta/models/"
          "gemini-x%2F..%2F..%2Fv1beta%2Ffiles%3F"
          ":streamGenerateContent?alt=sse");

  auto spaced = MakeRouter().Resolve("gemini-pro#frag ment");
  REQUIRE(spaced.endpoint_url ==
          "https://generativelanguage.googleapis.com/v1beta/models/"
          "gemini-pro%23frag%20ment:generateContent");
}

TEST_CASE("xAI is OpenAI-compatible", "[router]") {
  auto target = MakeRouter().Resolve("grok-2");
  REQUIRE(target.provider == "xai");
  REQUIRE(target.wire_format == WireFormat::kOpenAI);
  REQUIRE(target.endpoint_url == "https://api.x.ai/v1/chat/completions");
  REQUIRE(target.headers.at("Authorization") == "Bearer xk-xai");
}

TEST_CASE("Unknown models go to the fallback endpoint", "[router]") {
  auto router = MakeRouter();
  for (const char* model : {"llama3", "mistral-large", "", "gp-4"}) {
    auto target = router.Resolve(model);
    INFO(model);
    REQUIRE(target.provider == "fallback");
    REQUIRE(target.wire_format == WireFormat::kOpenAI);
    REQUIRE(target.endpoint_url == "http://local-llm:8000/v1/chat/completions");
    REQUIRE(target.headers.empty());
  }
}

TEST_CASE("Missing credentials produce no auth header", "[router]") {
  sentinel::ProviderRouter router{sentinel::RouterConfig{}};
  REQUIRE(router.Resolve("gpt-4o").headers.empty());
  auto anthropic = router.Resolve("claude-3-haiku");
  REQUIRE(anthropic.headers.count("x-api-key") == 0);
  REQUIRE(anthropic.headers.count("anthropic-version") == 1);

  sentinel::RouterConfig with_fallback_key;
  with_fallback_key.credentials.fallback_api_key = "local";
  sentinel::ProviderRouter local(with_fallback_key);
  REQUIRE(local.Resolve("llama3").headers.at("Authorization") ==
          "Bearer local");
}

TEST_CASE("WireFormatName", "[router]") {
  REQUIRE(std::string(sentinel::WireFormatName(WireFormat::kOpenAI)) ==
          "openai");
  REQUIRE(std::string(sentinel::WireFormatName(WireFormat::kAnthropic)) ==
          "anthropic");
  REQUIRE(std::string(sentinel::WireFormatName(WireFormat::kGemini)) ==
          "gemini");
}
