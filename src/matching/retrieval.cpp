#include "takoa/matching/retrieval.h"

#include <algorithm>
#include <set>

namespace takoa::matching {

core::Result<RetrievalResult, core::EngineError> k_nearest(const engine::StoreSnapshot& snapshot,
                                                           const core::PersonId& id,
                                                           const std::size_t k) {
  using R = core::Result<RetrievalResult, core::EngineError>;

  const auto* query = snapshot.find(id);
  if (query == nullptr) {
    return R::err(core::not_found_error("unknown person: " + id.value));
  }

  RetrievalResult result;
  if (vector::is_zero(query->profile_vector)) {
    result.insufficient_data = true;
    return R::ok(std::move(result));
  }

  result.neighbors.reserve(snapshot.size());
  for (const auto& other : snapshot.records()) {
    if (other.id == id || vector::is_zero(other.profile_vector)) {
      continue;
    }
    auto sim = vector::cosine(query->profile_vector, other.profile_vector);
    if (!sim.has_value()) {
      return R::err(sim.error());
    }
    result.neighbors.push_back(Neighbor{other.id, sim.value()});
  }

  // Exact comparison: no epsilon, so equal similarities are exactly the ties.
  std::sort(result.neighbors.begin(), result.neighbors.end(),
            [](const Neighbor& a, const Neighbor& b) {
              if (a.similarity != b.similarity) {
                return a.similarity > b.similarity;
              }
              return a.id < b.id;
            });

  if (result.neighbors.size() > k) {
    result.neighbors.resize(k);
  }
  return R::ok(std::move(result));
}

core::Result<double, core::EngineError> group_cohesion(const engine::StoreSnapshot& snapshot,
                                                       const std::vector<core::PersonId>& ids) {
  using R = core::Result<double, core::EngineError>;

  const std::set<core::PersonId> unique(ids.begin(), ids.end());
  if (unique.size() < 2) {
    return R::err(core::validation_error("cohesion needs at least two distinct people"));
  }

  std::vector<const domain::PersonRecord*> members;
  members.reserve(unique.size());
  for (const auto& id : unique) {
    const auto* record = snapshot.find(id);
    if (record == nullptr) {
      return R::err(core::not_found_error("unknown person: " + id.value));
    }
    members.push_back(record);
  }

  double total = 0.0;
  std::size_t pairs = 0;
  for (std::size_t i = 0; i < members.size(); ++i) {
    for (std::size_t j = i + 1; j < members.size(); ++j) {
      auto sim = vector::cosine(members[i]->profile_vector, members[j]->profile_vector);
      if (!sim.has_value()) {
        return R::err(sim.error());
      }
      total += sim.value();
      ++pairs;
    }
  }
  return R::ok(total / static_cast<double>(pairs));
}

}  // namespace takoa::matching
