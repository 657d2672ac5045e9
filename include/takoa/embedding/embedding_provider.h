#pragma once

#include "takoa/core/result.h"
#include "takoa/vector/vector_math.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace takoa::embedding {

// IEmbeddingProvider maps text to a fixed-dimension vector.
// Failures (network, quota, malformed response) are returned, never thrown; the
// caller decides whether to fall back (see EmbeddingSource).
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  [[nodiscard]] virtual core::Result<vector::Vector, std::string> embed_text(
      std::string_view text) const = 0;

  [[nodiscard]] virtual std::size_t dimension() const = 0;

  // Stable identifier recorded in audit payloads, e.g. "hash-v1".
  [[nodiscard]] virtual std::string provider_id() const = 0;
};

// HashEmbeddingProvider generates stable pseudo-embeddings with no external calls.
// Strategy: tokenize, hash each token to a bucket with FNV-1a, add the token count
// there and 0.3x to each neighbouring bucket, then L2-normalize.
// Same text always yields the same vector; text without tokens yields zeros.
class HashEmbeddingProvider final : public IEmbeddingProvider {
 public:
  explicit HashEmbeddingProvider(std::size_t dim = 16);

  [[nodiscard]] core::Result<vector::Vector, std::string> embed_text(
      std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::string provider_id() const override { return "hash-v1"; }

 private:
  std::size_t dimension_;
};

}  // namespace takoa::embedding
