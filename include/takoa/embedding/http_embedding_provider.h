#pragma once

#include "takoa/embedding/embedding_provider.h"

#include <string>

namespace takoa::embedding {

struct HttpEmbeddingConfig {
  // OpenAI-compatible embeddings endpoint.
  std::string endpoint{"https://api.openai.com/v1/embeddings"};  // NOLINT(readability-identifier-naming)
  std::string model{"text-embedding-3-small"};                   // NOLINT(readability-identifier-naming)
  std::string api_key;                                           // NOLINT(readability-identifier-naming)
  std::size_t dimension{16};                                     // NOLINT(readability-identifier-naming)
  long connect_timeout_ms{2000};                                 // NOLINT(readability-identifier-naming)
  long timeout_ms{8000};                                         // NOLINT(readability-identifier-naming)
};

// HttpEmbeddingProvider calls a remote embeddings API through libcurl.
//
// The returned vector is the first `dimension` components of the model output,
// L2-normalized. Transport errors, non-2xx statuses, malformed bodies and short
// vectors are all returned as errors; nothing throws.
//
// Each call uses its own curl easy handle, so one instance may serve concurrent
// callers. curl_global_init must have run before the first call (the CLI does it
// in main).
class HttpEmbeddingProvider final : public IEmbeddingProvider {
 public:
  explicit HttpEmbeddingProvider(HttpEmbeddingConfig config);

  [[nodiscard]] core::Result<vector::Vector, std::string> embed_text(
      std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return config_.dimension; }
  [[nodiscard]] std::string provider_id() const override { return "http:" + config_.model; }

 private:
  HttpEmbeddingConfig config_;
};

// Builds the request body sent to the endpoint.
[[nodiscard]] std::string build_embedding_request(const std::string& model, std::string_view text);

// Extracts data[0].embedding from a response body, truncated to dimension and normalized.
[[nodiscard]] core::Result<vector::Vector, std::string> parse_embedding_response(
    const std::string& body, std::size_t dimension);

}  // namespace takoa::embedding
