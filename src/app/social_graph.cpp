#include "takoa/app/social_graph.h"

#include "takoa/clustering/dbscan.h"
#include "takoa/domain/person.h"
#include "takoa/matching/retrieval.h"

#include <random>
#include <set>
#include <utility>

namespace takoa::app {

std::optional<GraphMode> graph_mode_from_string(const std::string_view name) {
  if (name == "force") {
    return GraphMode::kForce;
  }
  if (name == "embedding") {
    return GraphMode::kEmbedding;
  }
  return std::nullopt;
}

const char* to_string(const GraphMode mode) {
  switch (mode) {
    case GraphMode::kForce:
      return "force";
    case GraphMode::kEmbedding:
      return "embedding";
  }
  return "unknown";
}

core::Result<SocialGraph, core::EngineError> build_social_graph(
    const engine::StoreSnapshot& snapshot, const domain::EngineConfig& config,
    const GraphOptions& options) {
  using R = core::Result<SocialGraph, core::EngineError>;

  SocialGraph graph;
  graph.mode = options.mode;
  if (snapshot.empty()) {
    return R::ok(std::move(graph));
  }

  const auto vectors = snapshot.vectors();

  auto labels = clustering::dbscan(
      vectors, clustering::DbscanParams{config.dbscan_epsilon, config.dbscan_min_points});
  if (!labels.has_value()) {
    return R::err(labels.error());
  }
  const auto stats = clustering::cluster_stats(labels.value());
  graph.num_clusters = stats.num_clusters;
  graph.noise_count = stats.noise_count;

  std::vector<projection::Point3> positions(snapshot.size());
  if (options.mode == GraphMode::kEmbedding) {
    projection::ProjectionParams params;
    params.n_neighbors = config.projection_neighbors;
    params.min_dist = config.projection_min_dist;
    params.spread = config.projection_spread;
    params.n_epochs = config.projection_epochs;
    params.seed = config.projection_seed;

    auto projected = projection::UmapProjector(params).project(vectors);
    if (!projected.has_value()) {
      return R::err(projected.error());
    }
    graph.projection_fallback = projected.value().fallback;
    positions = std::move(projected.value().coordinates);
    for (auto& p : positions) {
      for (double& c : p) {
        c *= kGraphScale;
      }
    }
  } else {
    std::mt19937 rng(config.projection_seed);
    std::uniform_real_distribution<double> dist(-kGraphScale, kGraphScale);
    for (auto& p : positions) {
      for (double& c : p) {
        c = dist(rng);
      }
    }
  }

  const auto& records = snapshot.records();
  graph.nodes.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    graph.nodes.push_back(GraphNode{&records[i], labels.value()[i], positions[i]});
  }

  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& record : records) {
    auto neighbours = matching::k_nearest(snapshot, record.id, options.neighbors);
    if (!neighbours.has_value()) {
      return R::err(neighbours.error());
    }
    for (const auto& n : neighbours.value().neighbors) {
      auto key = record.id.value < n.id.value ? std::make_pair(record.id.value, n.id.value)
                                              : std::make_pair(n.id.value, record.id.value);
      if (seen.insert(std::move(key)).second) {
        graph.links.push_back(GraphLink{record.id, n.id, n.similarity});
      }
    }
  }

  return R::ok(std::move(graph));
}

nlohmann::json graph_to_json(const SocialGraph& graph) {
  nlohmann::json nodes = nlohmann::json::array();
  for (const auto& node : graph.nodes) {
    nlohmann::json j = domain::person_to_json(*node.person);
    j.erase("semantic");
    j["cluster_id"] = node.cluster;
    j["x"] = node.position[0];
    j["y"] = node.position[1];
    j["z"] = node.position[2];
    nodes.push_back(std::move(j));
  }

  nlohmann::json links = nlohmann::json::array();
  for (const auto& link : graph.links) {
    links.push_back(nlohmann::json{
        {"source", link.source.value}, {"target", link.target.value}, {"strength", link.strength}});
  }

  return {
      {"mode", to_string(graph.mode)},
      {"nodes", std::move(nodes)},
      {"links", std::move(links)},
      {"num_clusters", graph.num_clusters},
      {"noise_count", graph.noise_count},
      {"projection_fallback", graph.projection_fallback},
  };
}

core::Result<nlohmann::json, core::EngineError> run_graph_pipeline(const GraphOptions& options,
                                                                   core::Services& services,
                                                                   core::IIdGenerator& id_gen,
                                                                   core::IClock& clock) {
  using R = core::Result<nlohmann::json, core::EngineError>;

  const std::string trace_id = core::new_trace_id(id_gen).value;
  const engine::StoreSnapshot snapshot = services.store.snapshot();

  auto graph = build_social_graph(snapshot, services.store.config(), options);
  if (!graph.has_value()) {
    return R::err(graph.error());
  }
  const SocialGraph& g = graph.value();

  if (g.projection_fallback) {
    const nlohmann::json payload = {{"points", g.nodes.size()},
                                    {"n_neighbors", services.store.config().projection_neighbors}};
    services.audit_log.append({id_gen.next("evt"), trace_id, "ProjectionFallbackUsed",
                               payload.dump(), clock.now_iso8601(), {}});
  }

  const nlohmann::json summary = {{"mode", to_string(g.mode)},
                                  {"nodes", g.nodes.size()},
                                  {"links", g.links.size()},
                                  {"num_clusters", g.num_clusters},
                                  {"noise_count", g.noise_count}};
  services.audit_log.append({id_gen.next("evt"), trace_id, "GraphComputed", summary.dump(),
                             clock.now_iso8601(), {}});

  return R::ok(graph_to_json(g));
}

}  // namespace takoa::app
