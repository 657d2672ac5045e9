#pragma once

#include "takoa/domain/traits.h"
#include "takoa/vector/vector_math.h"

#include <array>
#include <cstddef>

namespace takoa::profile {

inline constexpr std::size_t kCompositeCount = 5;
inline constexpr std::size_t kTraitBlockSize = domain::kTraitCount + kCompositeCount;

struct FusionWeights {
  double trait_weight{0.7};     // NOLINT(readability-identifier-naming)
  double semantic_weight{0.3};  // NOLINT(readability-identifier-naming)
};

// Pairwise trait composites, each clamped to [0,1], in this order:
//   (E + A) / 2, (C + (1 - O)) / 2, 1 - N, (O + E) / 2, (A + (1 - N)) / 2
// They let plain cosine similarity see some interaction between traits.
[[nodiscard]] std::array<double, kCompositeCount> derived_composites(
    const domain::TraitProfile& traits);

// 5 raw traits followed by the 5 composites.
[[nodiscard]] vector::Vector trait_block(const domain::TraitProfile& traits);

// normalize(trait) * trait_weight ++ normalize(semantic) * semantic_weight, normalized.
// A zero block contributes zeros; if both are zero the zero vector is returned.
[[nodiscard]] vector::Vector fuse_blocks(const vector::Vector& trait_values,
                                         const vector::Vector& semantic,
                                         const FusionWeights& weights);

// fuse builds the ProfileVector (length 10 + semantic.size()) for a person.
[[nodiscard]] vector::Vector fuse(const domain::TraitProfile& traits,
                                  const vector::Vector& semantic, const FusionWeights& weights);

}  // namespace takoa::profile
