#pragma once

#include "takoa/core/ids.h"
#include "takoa/core/result.h"
#include "takoa/engine/profile_store.h"

#include <cstddef>
#include <vector>

namespace takoa::matching {

struct Neighbor {
  core::PersonId id;       // NOLINT(readability-identifier-naming)
  double similarity{0.0};  // NOLINT(readability-identifier-naming)
};

struct RetrievalResult {
  std::vector<Neighbor> neighbors;  // NOLINT(readability-identifier-naming)
  // The query vector is all zero: there is nothing to compare yet.
  bool insufficient_data{false};  // NOLINT(readability-identifier-naming)
};

// k_nearest ranks every other person by cosine similarity to `id`.
//
// Exact O(n) scan over the snapshot. The query id is never returned; people with
// a zero ProfileVector are skipped. Ordering is similarity descending, ties by
// ascending id, and the first k are returned.
//
// Errors: kNotFound if `id` is not in the snapshot, kValidation if stored vectors
// disagree in length.
[[nodiscard]] core::Result<RetrievalResult, core::EngineError> k_nearest(
    const engine::StoreSnapshot& snapshot, const core::PersonId& id, std::size_t k);

// Mean pairwise cosine similarity within a group (at least two distinct ids).
[[nodiscard]] core::Result<double, core::EngineError> group_cohesion(
    const engine::StoreSnapshot& snapshot, const std::vector<core::PersonId>& ids);

}  // namespace takoa::matching
