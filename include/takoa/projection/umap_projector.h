#pragma once

#include "takoa/core/result.h"
#include "takoa/vector/vector_math.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace takoa::projection {

using Point3 = std::array<double, 3>;

inline constexpr double kFallbackCubeHalfWidth = 1.0;

struct ProjectionParams {
  std::size_t n_neighbors{15};        // NOLINT(readability-identifier-naming)
  double min_dist{0.1};                // NOLINT(readability-identifier-naming)
  double spread{1.0};                  // NOLINT(readability-identifier-naming)
  std::size_t n_epochs{200};          // NOLINT(readability-identifier-naming)
  std::size_t negative_sample_rate{5};  // NOLINT(readability-identifier-naming)
  std::uint32_t seed{42};              // NOLINT(readability-identifier-naming)
  // Spectral initialization is skipped above this many points (dense eigensolve).
  std::size_t max_spectral_points{2000};  // NOLINT(readability-identifier-naming)
};

struct ProjectionResult {
  std::vector<Point3> coordinates;  // NOLINT(readability-identifier-naming)
  // True when there were fewer points than n_neighbors: coordinates are uniform
  // random in [-1,1]^3 and carry no spatial meaning.
  bool fallback{false};  // NOLINT(readability-identifier-naming)
};

// UmapProjector reduces ProfileVectors to 3D for display, preserving local
// neighbourhoods (UMAP: fuzzy kNN graph + cross-entropy layout by SGD).
//
// Output is for rendering only and must never feed similarity or clustering.
// Deterministic for a fixed seed and input order.
class UmapProjector {
 public:
  explicit UmapProjector(ProjectionParams params);

  // Errors: kValidation when vectors differ in length.
  [[nodiscard]] core::Result<ProjectionResult, core::EngineError> project(
      const std::vector<vector::Vector>& vectors) const;

  [[nodiscard]] const ProjectionParams& params() const { return params_; }

 private:
  ProjectionParams params_;
};

// Fits the low-dimensional membership curve 1 / (1 + a * d^(2b)) to the
// min_dist/spread target. Returned as {a, b}.
[[nodiscard]] std::pair<double, double> fit_ab(double spread, double min_dist);

}  // namespace takoa::projection
