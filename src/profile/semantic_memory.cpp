#include "takoa/profile/semantic_memory.h"

namespace takoa::profile {

SemanticUpdate seed_from_interests(const std::vector<std::string>& interest_tags,
                                   embedding::EmbeddingSource& embeddings) {
  const std::size_t dim = embeddings.dimension();
  std::vector<double> sum(dim, 0.0);
  bool used_fallback = false;

  for (const auto& tag : interest_tags) {
    const auto outcome = embeddings.embed(tag);
    used_fallback = used_fallback || outcome.used_fallback;
    for (std::size_t i = 0; i < dim && i < outcome.vector.size(); ++i) {
      sum[i] += static_cast<double>(outcome.vector[i]);
    }
  }

  vector::Vector mean(dim, 0.0f);
  if (!interest_tags.empty()) {
    const auto count = static_cast<double>(interest_tags.size());
    for (std::size_t i = 0; i < dim; ++i) {
      mean[i] = static_cast<float>(sum[i] / count);
    }
  }
  return SemanticUpdate{vector::normalize(mean), used_fallback};
}

SemanticUpdate update_semantic(const std::optional<vector::Vector>& prior,
                               const std::vector<std::string>& interest_tags,
                               std::optional<std::string_view> message,
                               embedding::EmbeddingSource& embeddings, const double beta) {
  SemanticUpdate current;
  if (prior.has_value() && prior->size() == embeddings.dimension()) {
    current.memory = prior.value();
  } else {
    current = seed_from_interests(interest_tags, embeddings);
  }

  if (!message.has_value()) {
    return current;
  }

  const auto outcome = embeddings.embed(message.value());
  if (vector::is_zero(outcome.vector)) {
    return current;
  }

  // Sizes are equal by construction: both come from the same EmbeddingSource.
  auto blended = vector::blend(current.memory, outcome.vector, beta);
  if (blended.has_value()) {
    current.memory = std::move(blended.value());
  }
  current.used_fallback = current.used_fallback || outcome.used_fallback;
  return current;
}

}  // namespace takoa::profile
