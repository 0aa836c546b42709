#include "guardrails/embedding_backend.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>

namespace sentinel {

using json = nlohmann::json;

HttpEmbeddingBackend::HttpEmbeddingBackend(std::string endpoint,
                                           std::string model,
                                           std::string api_key, int timeout_ms)
    : endpoint_(std::move(endpoint)),
      model_(std::move(model)),
      api_key_(std::move(api_key)),
      client_(timeout_ms) {}

std::vector<Embedding> HttpEmbeddingBackend::Embed(
    const std::vector<std::string>& texts) const {
  json payload = {{"model", model_}, {"input", texts}};
  std::map<std::string, std::string> headers;
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  auto response = client_.Post(
      endpoint_, payload.dump(-1, ' ', false, json::error_handler_t::replace),
      headers);
  if (response.status != 200) {
    throw std::runtime_error("embedding endpoint returned status " +
                             std::to_string(response.status));
  }
  auto body = json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.contains("data") ||
      !body["data"].is_array()) {
    throw std::runtime_error("embedding endpoint returned malformed body");
  }
  std::vector<Embedding> out(texts.size());
  std::size_t position = 0;
  for (const auto& item : body["data"]) {
    std::size_t index = item.value("index", position);
    ++position;
    if (index >= out.size() || !item.contains("embedding") ||
        !item["embedding"].is_array()) {
      throw std::runtime_error("embedding endpoint returned malformed item");
    }
    out[index] = item["embedding"].get<Embedding>();
  }
  for (const auto& vec : out) {
    if (vec.empty()) {
      throw std::runtime_error("embedding endpoint omitted an input");
    }
  }
  return out;
}

double CosineSimilarity(const Embedding& a, const Embedding& b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace sentinel
