#include "takoa/core/hashing.h"
#include "takoa/core/normalization.h"
#include "takoa/embedding/embedding_provider.h"

#include <map>

namespace takoa::embedding {

HashEmbeddingProvider::HashEmbeddingProvider(std::size_t dim) : dimension_(dim) {}

core::Result<vector::Vector, std::string> HashEmbeddingProvider::embed_text(
    std::string_view text) const {
  using R = core::Result<vector::Vector, std::string>;

  vector::Vector embedding(dimension_, 0.0f);
  if (dimension_ == 0) {
    return R::ok(embedding);
  }

  // Single-letter words still carry meaning for short interest tags ("c", "r").
  const auto tokens = core::tokenize_ascii(text, 1);
  if (tokens.empty()) {
    return R::ok(embedding);
  }

  std::map<std::string, int> token_counts;
  for (const auto& token : tokens) {
    token_counts[token]++;
  }

  for (const auto& [token, count] : token_counts) {
    const std::size_t idx = core::hash_bucket(token, dimension_);
    const auto weight = static_cast<float>(count);

    embedding[idx] += weight;
    if (dimension_ > 1) {
      embedding[(idx + dimension_ - 1) % dimension_] += weight * 0.3f;
      embedding[(idx + 1) % dimension_] += weight * 0.3f;
    }
  }

  return R::ok(vector::normalize(embedding));
}

}  // namespace takoa::embedding
