#include "takoa/profile/fusion.h"

namespace takoa::profile {

using domain::Trait;

std::array<double, kCompositeCount> derived_composites(const domain::TraitProfile& traits) {
  const double o = traits.value(Trait::kOpenness);
  const double c = traits.value(Trait::kConscientiousness);
  const double e = traits.value(Trait::kExtraversion);
  const double a = traits.value(Trait::kAgreeableness);
  const double n = traits.value(Trait::kNeuroticism);

  return {
      domain::clamp_unit((e + a) / 2.0),
      domain::clamp_unit((c + (1.0 - o)) / 2.0),
      domain::clamp_unit(1.0 - n),
      domain::clamp_unit((o + e) / 2.0),
      domain::clamp_unit((a + (1.0 - n)) / 2.0),
  };
}

vector::Vector trait_block(const domain::TraitProfile& traits) {
  vector::Vector block;
  block.reserve(kTraitBlockSize);
  for (const double v : traits.values()) {
    block.push_back(static_cast<float>(v));
  }
  for (const double v : derived_composites(traits)) {
    block.push_back(static_cast<float>(v));
  }
  return block;
}

vector::Vector fuse_blocks(const vector::Vector& trait_values, const vector::Vector& semantic,
                           const FusionWeights& weights) {
  const vector::Vector t = vector::normalize(trait_values);
  const vector::Vector s = vector::normalize(semantic);

  vector::Vector combined;
  combined.reserve(t.size() + s.size());
  for (const float v : t) {
    combined.push_back(static_cast<float>(static_cast<double>(v) * weights.trait_weight));
  }
  for (const float v : s) {
    combined.push_back(static_cast<float>(static_cast<double>(v) * weights.semantic_weight));
  }

  return vector::normalize(combined);
}

vector::Vector fuse(const domain::TraitProfile& traits, const vector::Vector& semantic,
                    const FusionWeights& weights) {
  return fuse_blocks(trait_block(traits), semantic, weights);
}

}  // namespace takoa::profile
