#pragma once

#include "net/http_client.h"

#include <string>
#include <vector>

namespace sentinel {

using Embedding = std::vector<float>;

// Black-box text -> vector function used by the semantic detector.
// Implementations throw std::runtime_error on any failure and must be safe to
// call concurrently.
class EmbeddingBackend {
 public:
  virtual ~EmbeddingBackend() = default;

  virtual std::vector<Embedding> Embed(
      const std::vector<std::string>& texts) const = 0;
  virtual std::string Name() const = 0;
};

// Calls an OpenAI-compatible /v1/embeddings endpoint.
class HttpEmbeddingBackend : public EmbeddingBackend {
 public:
  HttpEmbeddingBackend(std::string endpoint, std::string model,
                       std::string api_key, int timeout_ms);

  std::vector<Embedding> Embed(
      const std::vector<std::string>& texts) const override;
  std::string Name() const override { return "http:" + model_; }

 private:
  std::string endpoint_;
  std::string model_;
  std::string api_key_;
  HttpClient client_;
};

// Returns 0 for empty or mismatched-length vectors.
double CosineSimilarity(const Embedding& a, const Embedding& b);

}  // namespace sentinel
