#pragma once

#include "takoa/core/ids.h"
#include "takoa/domain/traits.h"
#include "takoa/vector/vector_math.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace takoa::domain {

inline constexpr const char* kDefaultDisplayName = "Student";
inline constexpr int kDefaultAge = 20;
inline constexpr const char* kDefaultInstitution = "University";
inline constexpr double kDefaultConfidence = 0.3;

// PersonRecord is the unit of persistence: everything needed to rebuild a person's
// position in the similarity space after a restart.
//
// Invariants maintained by engine::ProfileStore (not by this struct):
// - confidence is in [0,1] and never decreases
// - profile_vector is unit length, or all zero ("insufficient data")
// - semantic_memory, when present, has EngineConfig::semantic_dim components
struct PersonRecord {
  core::PersonId id;                                   // NOLINT(readability-identifier-naming)
  std::string display_name{kDefaultDisplayName};       // NOLINT(readability-identifier-naming)
  int age{kDefaultAge};                                // NOLINT(readability-identifier-naming)
  std::string institution{kDefaultInstitution};        // NOLINT(readability-identifier-naming)
  TraitProfile traits;                                 // NOLINT(readability-identifier-naming)
  std::vector<std::string> interests;                  // NOLINT(readability-identifier-naming)
  double confidence{0.0};                              // NOLINT(readability-identifier-naming)
  vector::Vector profile_vector;                       // NOLINT(readability-identifier-naming)
  std::optional<vector::Vector> semantic_memory;       // NOLINT(readability-identifier-naming)
};

// JSON shape:
// {"id","name","age","uni","traits":{"openness",...},"interests":[],"confidence",
//  "vector":[],"semantic":[] (omitted when absent)}
[[nodiscard]] nlohmann::json traits_to_json(const TraitProfile& traits);
[[nodiscard]] TraitProfile traits_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json person_to_json(const PersonRecord& record);

// Missing optional fields take the onboarding defaults; a missing confidence
// becomes kDefaultConfidence. Throws nlohmann::json::exception on wrong types or
// a missing id.
[[nodiscard]] PersonRecord person_from_json(const nlohmann::json& j);

}  // namespace takoa::domain
