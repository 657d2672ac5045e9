#pragma once

#include "takoa/embedding/embedding_source.h"
#include "takoa/vector/vector_math.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace takoa::profile {

struct SemanticUpdate {
  vector::Vector memory;      // NOLINT(readability-identifier-naming)
  bool used_fallback{false};  // NOLINT(readability-identifier-naming)
};

// seed_from_interests returns the normalized mean embedding of the tags, or the
// zero vector when there are none.
[[nodiscard]] SemanticUpdate seed_from_interests(const std::vector<std::string>& interest_tags,
                                                 embedding::EmbeddingSource& embeddings);

// update_semantic advances one person's semantic memory.
//
// Without a prior memory (or with one of the wrong dimension) the memory is
// seeded from the interest tags. If a message is given it is then blended in:
//   normalize(old * (1 - beta) + embed(message) * beta)
// so a single noisy message moves the memory by at most a beta-weighted step.
//
// All embedding calls happen here; callers must not hold shared locks across it.
[[nodiscard]] SemanticUpdate update_semantic(const std::optional<vector::Vector>& prior,
                                             const std::vector<std::string>& interest_tags,
                                             std::optional<std::string_view> message,
                                             embedding::EmbeddingSource& embeddings, double beta);

}  // namespace takoa::profile
