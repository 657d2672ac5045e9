#pragma once

#include "takoa/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace takoa::domain {

// EngineConfig collects every tunable constant of the profile engine.
//
// None of the defaults has a derivation beyond "worked in practice"; they are
// configuration, not invariants.
// Keys in the JSON representation are sorted alphabetically for determinism.
struct EngineConfig {
  // ── Vector fusion ──────────────────────────────────────────────
  std::size_t semantic_dim{16};  // NOLINT(readability-identifier-naming)
  double trait_weight{0.7};      // NOLINT(readability-identifier-naming)
  double semantic_weight{0.3};   // NOLINT(readability-identifier-naming)

  // ── Online updates ─────────────────────────────────────────────
  double semantic_blend{0.25};   // NOLINT(readability-identifier-naming)
  double trait_step{0.2};        // NOLINT(readability-identifier-naming)
  double vector_blend{0.3};      // NOLINT(readability-identifier-naming)
  double confidence_gain{0.1};   // NOLINT(readability-identifier-naming)

  // ── Match explanation ──────────────────────────────────────────
  double interest_bonus{0.15};    // NOLINT(readability-identifier-naming)
  std::size_t explain_top_n{5};  // NOLINT(readability-identifier-naming)

  // ── Clustering ─────────────────────────────────────────────────
  double dbscan_epsilon{0.3};         // NOLINT(readability-identifier-naming)
  std::size_t dbscan_min_points{3};  // NOLINT(readability-identifier-naming)

  // ── Projection ─────────────────────────────────────────────────
  std::size_t projection_neighbors{15};  // NOLINT(readability-identifier-naming)
  double projection_min_dist{0.1};       // NOLINT(readability-identifier-naming)
  double projection_spread{1.0};         // NOLINT(readability-identifier-naming)
  std::size_t projection_epochs{200};    // NOLINT(readability-identifier-naming)
  std::uint32_t projection_seed{42};     // NOLINT(readability-identifier-naming)

  // Length of every ProfileVector produced under this config.
  [[nodiscard]] std::size_t profile_dim() const { return 10 + semantic_dim; }
};

// validate checks ranges: both fusion weights > 0, blend factors and steps in
// [0,1], dimensions and counts non-zero, epsilon and distances positive.
[[nodiscard]] core::Result<bool, core::EngineError> validate(const EngineConfig& config);

// to_json serializes an EngineConfig to a JSON string with sorted keys.
[[nodiscard]] std::string to_json(const EngineConfig& config);

// from_json reads an EngineConfig; absent keys keep their defaults.
// Malformed JSON or wrongly typed values are validation errors. The result is
// not range-checked: call validate().
[[nodiscard]] core::Result<EngineConfig, core::EngineError> engine_config_from_json(
    const std::string& json_str);

}  // namespace takoa::domain
