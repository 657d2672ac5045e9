#include "takoa/app/json_views.h"

namespace takoa::app {

namespace {

nlohmann::json person_ref(const engine::StoreSnapshot& snapshot, const core::PersonId& id) {
  const auto* record = snapshot.find(id);
  return {{"id", id.value}, {"name", record != nullptr ? record->display_name : ""}};
}

}  // namespace

nlohmann::json neighbors_to_json(const core::PersonId& query,
                                 const matching::RetrievalResult& result) {
  nlohmann::json neighbours = nlohmann::json::array();
  for (const auto& n : result.neighbors) {
    neighbours.push_back(nlohmann::json{{"id", n.id.value}, {"similarity", n.similarity}});
  }
  return {{"id", query.value},
          {"neighbors", std::move(neighbours)},
          {"insufficient_data", result.insufficient_data}};
}

nlohmann::json explanation_to_json(const engine::StoreSnapshot& snapshot,
                                   const domain::MatchExplanation& explanation) {
  nlohmann::json contributors = nlohmann::json::array();
  for (const auto& c : explanation.contributions) {
    contributors.push_back(nlohmann::json{
        {"dimension", c.label}, {"contribution", c.value}, {"source", domain::to_string(c.source)}});
  }
  return {{"user1", person_ref(snapshot, explanation.a)},
          {"user2", person_ref(snapshot, explanation.b)},
          {"similarity", explanation.similarity},
          {"insufficient_data", explanation.insufficient_data},
          {"top_contributors", std::move(contributors)},
          {"shared_interests", explanation.shared_interest_tags}};
}

nlohmann::json clusters_to_json(const engine::StoreSnapshot& snapshot,
                                const std::vector<int>& labels) {
  nlohmann::json assignments = nlohmann::json::object();
  const auto& records = snapshot.records();
  for (std::size_t i = 0; i < records.size() && i < labels.size(); ++i) {
    assignments[records[i].id.value] = labels[i];
  }

  const auto stats = clustering::cluster_stats(labels);
  nlohmann::json sizes = nlohmann::json::object();
  for (const auto& [cluster, size] : stats.cluster_sizes) {
    sizes[std::to_string(cluster)] = size;
  }

  return {{"labels", std::move(assignments)},
          {"num_clusters", stats.num_clusters},
          {"noise_count", stats.noise_count},
          {"cluster_sizes", std::move(sizes)}};
}

}  // namespace takoa::app
