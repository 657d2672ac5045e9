#pragma once

#include "takoa/core/result.h"
#include "takoa/domain/match_explanation.h"
#include "takoa/engine/profile_store.h"

#include <cstddef>

namespace takoa::matching {

struct ExplainOptions {
  double interest_bonus{0.15};  // NOLINT(readability-identifier-naming)
  std::size_t top_n{5};         // NOLINT(readability-identifier-naming)
};

// contribution = (1 - |a - b|) * a * b
// High only when both values are high and agree; near zero when either is near zero.
[[nodiscard]] double agreement_contribution(double a, double b);

// explain decomposes the similarity of a and b into ranked contributions.
//
// Terms pooled:
// - the five raw trait components of each ProfileVector, labelled by trait name
// - each semantic-memory dimension, labelled interest_embedding_<n> (1-based);
//   omitted when either person has no semantic memory
// - a fixed bonus per shared interest tag, labelled interest:<tag>
// Sorted by value descending (ties by label), truncated to top_n.
//
// similarity is exactly vector::cosine(a.profile_vector, b.profile_vector).
// Errors: kNotFound for an unknown id; kValidation for mismatched vector lengths.
[[nodiscard]] core::Result<domain::MatchExplanation, core::EngineError> explain(
    const engine::StoreSnapshot& snapshot, const core::PersonId& a, const core::PersonId& b,
    const ExplainOptions& options = {});

}  // namespace takoa::matching
