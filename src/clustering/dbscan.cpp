#include "takoa/clustering/dbscan.h"

namespace takoa::clustering {

namespace {

// Pairwise distance matrix, upper triangle mirrored. O(n^2) memory is fine at the
// scale this engine targets (see DESIGN.md on the exact-scan limit).
std::vector<std::vector<double>> distance_matrix(const std::vector<vector::Vector>& points) {
  const std::size_t n = points.size();
  std::vector<std::vector<double>> d(n, std::vector<double>(n, 0.0));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      // Lengths were checked by the caller.
      const double dist = vector::euclidean_distance(points[i], points[j]).value();
      d[i][j] = dist;
      d[j][i] = dist;
    }
  }
  return d;
}

std::vector<std::size_t> region_query(const std::vector<std::vector<double>>& d,
                                      const std::size_t p, const double epsilon) {
  std::vector<std::size_t> out;
  for (std::size_t q = 0; q < d.size(); ++q) {
    if (d[p][q] < epsilon) {
      out.push_back(q);
    }
  }
  return out;
}

}  // namespace

core::Result<std::vector<int>, core::EngineError> dbscan(const std::vector<vector::Vector>& points,
                                                         const DbscanParams& params) {
  using R = core::Result<std::vector<int>, core::EngineError>;

  for (const auto& p : points) {
    if (p.size() != points.front().size()) {
      return R::err(core::validation_error("cannot cluster vectors of different lengths"));
    }
  }

  const std::size_t n = points.size();
  std::vector<int> labels(n, kNoise);
  if (n == 0) {
    return R::ok(std::move(labels));
  }

  const auto d = distance_matrix(points);
  std::vector<bool> visited(n, false);
  int next_cluster = 0;

  for (std::size_t p = 0; p < n; ++p) {
    if (visited[p]) {
      continue;
    }
    visited[p] = true;

    auto seeds = region_query(d, p, params.epsilon);
    if (seeds.size() < params.min_points) {
      continue;  // noise for now; may still become a border point of a later cluster
    }

    const int cluster = next_cluster++;
    labels[p] = cluster;

    std::vector<bool> queued(n, false);
    for (const auto s : seeds) {
      queued[s] = true;
    }

    // seeds grows while iterating; index access keeps that well-defined.
    for (std::size_t i = 0; i < seeds.size(); ++i) {
      const std::size_t q = seeds[i];
      if (!visited[q]) {
        visited[q] = true;
        const auto expansion = region_query(d, q, params.epsilon);
        if (expansion.size() >= params.min_points) {
          for (const auto e : expansion) {
            if (!queued[e]) {
              queued[e] = true;
              seeds.push_back(e);
            }
          }
        }
      }
      if (labels[q] == kNoise) {
        labels[q] = cluster;
      }
    }
  }

  return R::ok(std::move(labels));
}

ClusterStats cluster_stats(const std::vector<int>& labels) {
  ClusterStats stats;
  for (const int label : labels) {
    if (label == kNoise) {
      ++stats.noise_count;
    } else {
      ++stats.cluster_sizes[label];
    }
  }
  stats.num_clusters = stats.cluster_sizes.size();
  return stats;
}

}  // namespace takoa::clustering
