#pragma once

#include "takoa/clustering/dbscan.h"
#include "takoa/domain/match_explanation.h"
#include "takoa/engine/profile_store.h"
#include "takoa/matching/retrieval.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace takoa::app {

// JSON renderings of query results for the CLI's stdout.

[[nodiscard]] nlohmann::json neighbors_to_json(const core::PersonId& query,
                                               const matching::RetrievalResult& result);

[[nodiscard]] nlohmann::json explanation_to_json(const engine::StoreSnapshot& snapshot,
                                                 const domain::MatchExplanation& explanation);

// labels are in snapshot.records() order.
[[nodiscard]] nlohmann::json clusters_to_json(const engine::StoreSnapshot& snapshot,
                                              const std::vector<int>& labels);

}  // namespace takoa::app
