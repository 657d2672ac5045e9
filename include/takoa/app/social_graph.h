#pragma once

#include "takoa/core/clock.h"
#include "takoa/core/id_generator.h"
#include "takoa/core/result.h"
#include "takoa/core/services.h"
#include "takoa/domain/engine_config.h"
#include "takoa/engine/profile_store.h"
#include "takoa/projection/umap_projector.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace takoa::app {

enum class GraphMode {
  kForce,      // random starting positions; the renderer's force layout moves them
  kEmbedding,  // positions from the 3D projection of ProfileVectors
};

// Display coordinates span roughly [-kGraphScale, kGraphScale] on each axis.
inline constexpr double kGraphScale = 100.0;
inline constexpr std::size_t kDefaultGraphNeighbors = 5;

[[nodiscard]] std::optional<GraphMode> graph_mode_from_string(std::string_view name);
[[nodiscard]] const char* to_string(GraphMode mode);

struct GraphNode {
  const domain::PersonRecord* person{nullptr};  // NOLINT(readability-identifier-naming)
  int cluster{-1};                              // NOLINT(readability-identifier-naming)
  projection::Point3 position{};                // NOLINT(readability-identifier-naming)
};

struct GraphLink {
  core::PersonId source;   // NOLINT(readability-identifier-naming)
  core::PersonId target;   // NOLINT(readability-identifier-naming)
  double strength{0.0};    // NOLINT(readability-identifier-naming)
};

// Nodes point into the snapshot the graph was built from; keep it alive.
struct SocialGraph {
  GraphMode mode{GraphMode::kForce};      // NOLINT(readability-identifier-naming)
  std::vector<GraphNode> nodes;           // NOLINT(readability-identifier-naming)
  std::vector<GraphLink> links;           // NOLINT(readability-identifier-naming)
  std::size_t num_clusters{0};            // NOLINT(readability-identifier-naming)
  std::size_t noise_count{0};             // NOLINT(readability-identifier-naming)
  bool projection_fallback{false};        // NOLINT(readability-identifier-naming)
};

struct GraphOptions {
  GraphMode mode{GraphMode::kForce};             // NOLINT(readability-identifier-naming)
  std::size_t neighbors{kDefaultGraphNeighbors};  // NOLINT(readability-identifier-naming)
};

// build_social_graph assembles the display graph for a snapshot.
//
// Every person is a node labelled with its DBSCAN cluster. Each node links to
// its top-k neighbours; a pair linked from both ends appears once, keyed by the
// sorted id pair, with the similarity as strength. Positions are seeded by
// config.projection_seed, so the same snapshot and config give the same graph.
[[nodiscard]] core::Result<SocialGraph, core::EngineError> build_social_graph(
    const engine::StoreSnapshot& snapshot, const domain::EngineConfig& config,
    const GraphOptions& options);

[[nodiscard]] nlohmann::json graph_to_json(const SocialGraph& graph);

// Builds the graph over the current store contents and records GraphComputed
// (plus ProjectionFallbackUsed when the projection had too few points).
[[nodiscard]] core::Result<nlohmann::json, core::EngineError> run_graph_pipeline(
    const GraphOptions& options, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

}  // namespace takoa::app
