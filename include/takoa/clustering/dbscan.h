#pragma once

#include "takoa/core/result.h"
#include "takoa/vector/vector_math.h"

#include <cstddef>
#include <map>
#include <vector>

namespace takoa::clustering {

inline constexpr int kNoise = -1;

struct DbscanParams {
  double epsilon{0.3};         // NOLINT(readability-identifier-naming)
  std::size_t min_points{3};  // NOLINT(readability-identifier-naming)
};

// dbscan labels each point with a cluster id (0, 1, ...) or kNoise.
//
// Euclidean distance; a point's neighbourhood is every point (itself included)
// at distance strictly below epsilon. A point with at least min_points neighbours
// is a core point. Points are visited in input order, so labels are stable for a
// fixed input order and parameters. Cluster ids are only meaningful within one call.
//
// Errors: kValidation when points differ in length.
[[nodiscard]] core::Result<std::vector<int>, core::EngineError> dbscan(
    const std::vector<vector::Vector>& points, const DbscanParams& params);

struct ClusterStats {
  std::size_t num_clusters{0};                 // NOLINT(readability-identifier-naming)
  std::size_t noise_count{0};                  // NOLINT(readability-identifier-naming)
  std::map<int, std::size_t> cluster_sizes;    // NOLINT(readability-identifier-naming)
};

[[nodiscard]] ClusterStats cluster_stats(const std::vector<int>& labels);

}  // namespace takoa::clustering
