#pragma once

#include "takoa/core/ids.h"

#include <string>
#include <vector>

namespace takoa::domain {

enum class ContributionSource {
  kTrait,
  kSemantic,
  kSharedInterest,
};

// A single term of a match explanation, e.g. {"extraversion", 0.21} or
// {"interest:hiking", 0.15}.
struct Contribution {
  std::string label;            // NOLINT(readability-identifier-naming)
  double value{0.0};            // NOLINT(readability-identifier-naming)
  ContributionSource source{};  // NOLINT(readability-identifier-naming)
};

struct MatchExplanation {
  core::PersonId a;                                // NOLINT(readability-identifier-naming)
  core::PersonId b;                                // NOLINT(readability-identifier-naming)
  double similarity{0.0};                          // NOLINT(readability-identifier-naming)
  // Either ProfileVector is all zero; similarity is 0 by convention, not measured.
  bool insufficient_data{false};                   // NOLINT(readability-identifier-naming)
  std::vector<Contribution> contributions;         // NOLINT(readability-identifier-naming)
  std::vector<std::string> shared_interest_tags;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline const char* to_string(const ContributionSource source) {
  switch (source) {
    case ContributionSource::kTrait:
      return "trait";
    case ContributionSource::kSemantic:
      return "semantic";
    case ContributionSource::kSharedInterest:
      return "shared_interest";
  }
  return "unknown";
}

}  // namespace takoa::domain
