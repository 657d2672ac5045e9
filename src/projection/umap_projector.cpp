#include "takoa/projection/umap_projector.h"

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <random>

namespace takoa::projection {

namespace {

constexpr std::size_t kDims = 3;
constexpr double kLayoutScale = 10.0;
constexpr double kGradientClip = 4.0;
constexpr double kRepulsionStrength = 1.0;

struct Edge {
  std::size_t head;
  std::size_t tail;
  double weight;
};

using Neighbours = std::vector<std::vector<std::pair<std::size_t, double>>>;

double squared_distance(const vector::Vector& a, const vector::Vector& b) {
  double acc = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    acc += diff * diff;
  }
  return acc;
}

// Exact kNN by Euclidean distance; ties broken by index so the graph is deterministic.
Neighbours exact_knn(const std::vector<vector::Vector>& data, const std::size_t k) {
  const std::size_t n = data.size();
  Neighbours knn(n);
  for (std::size_t i = 0; i < n; ++i) {
    std::vector<std::pair<double, std::size_t>> dists;
    dists.reserve(n - 1);
    for (std::size_t j = 0; j < n; ++j) {
      if (j != i) {
        dists.emplace_back(std::sqrt(squared_distance(data[i], data[j])), j);
      }
    }
    std::partial_sort(dists.begin(), dists.begin() + static_cast<std::ptrdiff_t>(k), dists.end());
    for (std::size_t t = 0; t < k; ++t) {
      knn[i].emplace_back(dists[t].second, dists[t].first);
    }
  }
  return knn;
}

// Per-point rho (distance to nearest distinct neighbour) and sigma such that
// sum_j exp(-(d_j - rho) / sigma) == log2(k).
std::map<std::pair<std::size_t, std::size_t>, double> fuzzy_graph(const Neighbours& knn,
                                                                  const std::size_t k) {
  const double target = std::log2(static_cast<double>(k));
  const std::size_t n = knn.size();

  double mean_all = 0.0;
  std::size_t count_all = 0;
  for (const auto& row : knn) {
    for (const auto& [j, d] : row) {
      mean_all += d;
      ++count_all;
    }
  }
  mean_all = count_all > 0 ? mean_all / static_cast<double>(count_all) : 0.0;

  std::vector<std::map<std::size_t, double>> directed(n);
  for (std::size_t i = 0; i < n; ++i) {
    double rho = 0.0;
    for (const auto& [j, d] : knn[i]) {
      if (d > 0.0) {
        rho = d;
        break;
      }
    }

    double lo = 0.0;
    double hi = std::numeric_limits<double>::infinity();
    double mid = 1.0;
    for (int iter = 0; iter < 64; ++iter) {
      double psum = 0.0;
      for (const auto& [j, d] : knn[i]) {
        const double excess = d - rho;
        psum += excess > 0.0 ? std::exp(-excess / mid) : 1.0;
      }
      if (std::abs(psum - target) < 1e-5) {
        break;
      }
      if (psum > target) {
        hi = mid;
        mid = (lo + hi) / 2.0;
      } else {
        lo = mid;
        mid = std::isinf(hi) ? mid * 2.0 : (lo + hi) / 2.0;
      }
    }
    const double sigma = std::max(mid, 1e-3 * mean_all);

    for (const auto& [j, d] : knn[i]) {
      const double excess = std::max(0.0, d - rho);
      directed[i][j] = sigma > 0.0 ? std::exp(-excess / sigma) : (excess > 0.0 ? 0.0 : 1.0);
    }
  }

  // Fuzzy union of the two directed memberships: w1 + w2 - w1 * w2.
  std::map<std::pair<std::size_t, std::size_t>, double> sym;
  for (std::size_t i = 0; i < n; ++i) {
    for (const auto& [j, w1] : directed[i]) {
      const auto rev = directed[j].find(i);
      const double w2 = rev == directed[j].end() ? 0.0 : rev->second;
      const double w = w1 + w2 - w1 * w2;
      if (w > 0.0) {
        sym[{i, j}] = w;
        sym[{j, i}] = w;
      }
    }
  }
  return sym;
}

std::vector<Point3> random_layout(const std::size_t n, const double half_width,
                                  std::mt19937& rng) {
  std::uniform_real_distribution<double> dist(-half_width, half_width);
  std::vector<Point3> out(n);
  for (auto& p : out) {
    for (double& c : p) {
      c = dist(rng);
    }
  }
  return out;
}

// Laplacian eigenmap of the fuzzy graph: eigenvectors 1..3 of the symmetric
// normalized Laplacian, scaled so the largest coordinate is kLayoutScale.
bool spectral_layout(const std::size_t n,
                     const std::map<std::pair<std::size_t, std::size_t>, double>& graph,
                     std::vector<Point3>& out) {
  if (n < kDims + 2) {
    return false;
  }

  Eigen::MatrixXd w = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n),
                                            static_cast<Eigen::Index>(n));
  for (const auto& [edge, weight] : graph) {
    w(static_cast<Eigen::Index>(edge.first), static_cast<Eigen::Index>(edge.second)) = weight;
  }

  const Eigen::VectorXd degree = w.rowwise().sum();
  if ((degree.array() <= 0.0).any()) {
    return false;
  }
  const Eigen::VectorXd inv_sqrt = degree.array().rsqrt();
  const Eigen::MatrixXd laplacian =
      Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n)) -
      inv_sqrt.asDiagonal() * w * inv_sqrt.asDiagonal();

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(laplacian);
  if (solver.info() != Eigen::Success) {
    return false;
  }

  // Eigenvalues come back ascending; column 0 is the trivial eigenvector.
  const Eigen::MatrixXd embedding = solver.eigenvectors().middleCols(1, kDims);
  const double max_abs = embedding.cwiseAbs().maxCoeff();
  if (!std::isfinite(max_abs) || max_abs <= 0.0) {
    return false;
  }

  out.assign(n, Point3{});
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t c = 0; c < kDims; ++c) {
      out[i][c] = embedding(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(c)) *
                  (kLayoutScale / max_abs);
    }
  }
  return true;
}

double clip(const double v) {
  return std::clamp(v, -kGradientClip, kGradientClip);
}

double squared_distance3(const Point3& a, const Point3& b) {
  double acc = 0.0;
  for (std::size_t c = 0; c < kDims; ++c) {
    acc += (a[c] - b[c]) * (a[c] - b[c]);
  }
  return acc;
}

void optimize_layout(std::vector<Point3>& layout, const std::vector<Edge>& edges, const double a,
                     const double b, const ProjectionParams& params, std::mt19937& rng) {
  if (edges.empty()) {
    return;
  }

  const double n_epochs = static_cast<double>(params.n_epochs);
  const double max_weight =
      std::max_element(edges.begin(), edges.end(), [](const Edge& x, const Edge& y) {
        return x.weight < y.weight;
      })->weight;

  std::vector<double> epochs_per_sample(edges.size());
  for (std::size_t e = 0; e < edges.size(); ++e) {
    epochs_per_sample[e] = max_weight / edges[e].weight;
  }
  const double neg_rate = static_cast<double>(std::max<std::size_t>(1, params.negative_sample_rate));
  std::vector<double> epochs_per_negative(edges.size());
  std::vector<double> next_sample = epochs_per_sample;
  std::vector<double> next_negative(edges.size());
  for (std::size_t e = 0; e < edges.size(); ++e) {
    epochs_per_negative[e] = epochs_per_sample[e] / neg_rate;
    next_negative[e] = epochs_per_negative[e];
  }

  std::uniform_int_distribution<std::size_t> pick(0, layout.size() - 1);

  for (std::size_t epoch = 0; epoch < params.n_epochs; ++epoch) {
    const double n = static_cast<double>(epoch);
    const double alpha = 1.0 - n / n_epochs;

    for (std::size_t e = 0; e < edges.size(); ++e) {
      if (next_sample[e] > n) {
        continue;
      }
      Point3& current = layout[edges[e].head];
      Point3& other = layout[edges[e].tail];

      // Attraction along the edge.
      const double d2 = squared_distance3(current, other);
      if (d2 > 0.0) {
        const double coeff =
            -2.0 * a * b * std::pow(d2, b - 1.0) / (a * std::pow(d2, b) + 1.0);
        for (std::size_t c = 0; c < kDims; ++c) {
          const double grad = clip(coeff * (current[c] - other[c]));
          current[c] += grad * alpha;
          other[c] -= grad * alpha;
        }
      }
      next_sample[e] += epochs_per_sample[e];

      // Repulsion from uniformly sampled non-neighbours.
      const auto n_neg =
          static_cast<std::size_t>(std::max(0.0, (n - next_negative[e]) / epochs_per_negative[e]));
      for (std::size_t s = 0; s < n_neg; ++s) {
        const std::size_t k = pick(rng);
        if (k == edges[e].head) {
          continue;
        }
        const Point3& negative = layout[k];
        const double nd2 = squared_distance3(current, negative);
        const double coeff =
            nd2 > 0.0
                ? 2.0 * kRepulsionStrength * b / ((0.001 + nd2) * (a * std::pow(nd2, b) + 1.0))
                : 0.0;
        for (std::size_t c = 0; c < kDims; ++c) {
          const double grad = coeff > 0.0 ? clip(coeff * (current[c] - negative[c])) : kGradientClip;
          current[c] += grad * alpha;
        }
      }
      next_negative[e] += static_cast<double>(n_neg) * epochs_per_negative[e];
    }
  }
}

}  // namespace

std::pair<double, double> fit_ab(const double spread, const double min_dist) {
  // Least squares against the target curve: 1 below min_dist, exponential decay above.
  constexpr int kSamples = 300;
  std::vector<double> xs(kSamples);
  std::vector<double> ys(kSamples);
  for (int i = 0; i < kSamples; ++i) {
    xs[i] = spread * 3.0 * static_cast<double>(i) / static_cast<double>(kSamples - 1);
    ys[i] = xs[i] < min_dist ? 1.0 : std::exp(-(xs[i] - min_dist) / spread);
  }

  const auto sse = [&](const double a, const double b) {
    double total = 0.0;
    for (int i = 0; i < kSamples; ++i) {
      const double f = 1.0 / (1.0 + a * std::pow(xs[i], 2.0 * b));
      total += (f - ys[i]) * (f - ys[i]);
    }
    return total;
  };

  double best_a = 1.0;
  double best_b = 1.0;
  double best_err = std::numeric_limits<double>::infinity();
  for (double b = 0.3; b <= 2.5; b += 0.005) {
    // Ternary search over log(a) for this b.
    double lo = std::log(1e-3);
    double hi = std::log(1e3);
    for (int iter = 0; iter < 60; ++iter) {
      const double m1 = lo + (hi - lo) / 3.0;
      const double m2 = hi - (hi - lo) / 3.0;
      if (sse(std::exp(m1), b) < sse(std::exp(m2), b)) {
        hi = m2;
      } else {
        lo = m1;
      }
    }
    const double a = std::exp((lo + hi) / 2.0);
    const double err = sse(a, b);
    if (err < best_err) {
      best_err = err;
      best_a = a;
      best_b = b;
    }
  }
  return {best_a, best_b};
}

UmapProjector::UmapProjector(ProjectionParams params) : params_(params) {}

core::Result<ProjectionResult, core::EngineError> UmapProjector::project(
    const std::vector<vector::Vector>& vectors) const {
  using R = core::Result<ProjectionResult, core::EngineError>;

  for (const auto& v : vectors) {
    if (v.size() != vectors.front().size()) {
      return R::err(core::validation_error("cannot project vectors of different lengths"));
    }
  }

  std::mt19937 rng(params_.seed);
  const std::size_t n = vectors.size();

  ProjectionResult result;
  if (n < std::max<std::size_t>(2, params_.n_neighbors)) {
    result.coordinates = random_layout(n, kFallbackCubeHalfWidth, rng);
    result.fallback = true;
    return R::ok(std::move(result));
  }

  const std::size_t k = std::min(params_.n_neighbors, n - 1);
  const auto graph = fuzzy_graph(exact_knn(vectors, k), k);

  std::vector<Edge> edges;
  edges.reserve(graph.size());
  double max_weight = 0.0;
  for (const auto& [edge, weight] : graph) {
    max_weight = std::max(max_weight, weight);
  }
  // Edges too weak to be sampled even once over all epochs are dropped.
  const double min_weight = max_weight / static_cast<double>(params_.n_epochs);
  for (const auto& [edge, weight] : graph) {
    if (weight >= min_weight) {
      edges.push_back(Edge{edge.first, edge.second, weight});
    }
  }

  std::vector<Point3> layout;
  if (n > params_.max_spectral_points || !spectral_layout(n, graph, layout)) {
    layout = random_layout(n, kLayoutScale, rng);
  }

  const auto [a, b] = fit_ab(params_.spread, params_.min_dist);
  optimize_layout(layout, edges, a, b, params_, rng);

  result.coordinates = std::move(layout);
  return R::ok(std::move(result));
}

}  // namespace takoa::projection
